#include "Error.hpp"

#include "../Logging/Logging.hpp"

namespace FXN {

void Error::Log() const {
    FXN_LOG_ERROR(Service, "[{}] {}:{} in {}() - {} ({})",
                  ToString(severity),
                  location.FileName(),
                  location.line,
                  location.function,
                  ToString(code),
                  message);
}

void Error::LogAsWarning() const {
    FXN_LOG_WARNING(Service, "[{}] {}:{} in {}() - {} ({})",
                    ToString(severity),
                    location.FileName(),
                    location.line,
                    location.function,
                    ToString(code),
                    message);
}

} // namespace FXN
