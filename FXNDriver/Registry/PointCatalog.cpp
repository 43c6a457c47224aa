#include "PointCatalog.hpp"

#include <cmath>
#include <map>

namespace FXN::Registry {

namespace {

constexpr ObjectRef AI(uint32_t instance) { return {ObjectType::AnalogInput, instance}; }
constexpr ObjectRef AO(uint32_t instance) { return {ObjectType::AnalogOutput, instance}; }
constexpr ObjectRef AV(uint32_t instance) { return {ObjectType::AnalogValue, instance}; }
constexpr ObjectRef BI(uint32_t instance) { return {ObjectType::BinaryInput, instance}; }
constexpr ObjectRef BV(uint32_t instance) { return {ObjectType::BinaryValue, instance}; }
constexpr ObjectRef MSV(uint32_t instance) { return {ObjectType::MultiStateValue, instance}; }
constexpr ObjectRef PIV(uint32_t instance) { return {ObjectType::PositiveIntegerValue, instance}; }

// Order must follow the Point enum.
constexpr std::array<PointInfo, kPointCount> kPoints = {{
    {Point::kSetpointHome,        AV(1994), "Setpoint home",                      false},
    {Point::kSetpointAway,        AV(1985), "Setpoint away",                      false},
    {Point::kSupplyTemperature,   AI(4),    "Supply air temperature",             false},
    {Point::kOutdoorTemperature,  AI(1),    "Outdoor air temperature",            false},
    {Point::kExtractTemperature,  AI(95),   "Extract air temperature",            false},
    {Point::kExhaustTemperature,  AI(11),   "Exhaust air temperature",            false},
    {Point::kHumidity,            AI(96),   "Extract air humidity",               false},
    {Point::kHeaterPower,         AV(194),  "Heater power (kW)",                  false},
    {Point::kHeatingCoilEnable,   BV(445),  "Electric heater enable",             true},

    {Point::kSupplyFanRpm,        AI(5),    "Supply fan speed (rpm)",             false},
    {Point::kExtractFanRpm,       AI(12),   "Extract fan speed (rpm)",            false},
    {Point::kSupplyFanPercent,    AO(3),    "Supply fan control (%)",             false},
    {Point::kExtractFanPercent,   AO(4),    "Extract fan control (%)",            false},

    {Point::kFilterOperatingTime, AV(285),  "Filter operating time (h)",          false},
    {Point::kFilterLimit,         AV(286),  "Filter change interval (h)",         false},

    {Point::kComfortButton,       BV(50),   "Home/Away comfort button",           true},
    {Point::kComfortButtonDelay,  PIV(318), "Comfort button delay",               true},
    {Point::kVentilationMode,     MSV(42),  "Ventilation mode",                   true},
    {Point::kOperationMode,       MSV(361), "Operation mode",                     true},
    {Point::kRapidTrigger,        MSV(357), "Rapid ventilation trigger",          true},
    {Point::kRapidRuntime,        PIV(293), "Rapid ventilation runtime",          true},
    {Point::kRapidRemaining,      AV(2031), "Remaining time rapid ventilation",   true},
    {Point::kRapidActive,         BV(15),   "Rapid ventilation active",           true},
    {Point::kFireplaceTrigger,    MSV(360), "Fireplace ventilation trigger",      true},
    {Point::kFireplaceRuntime,    PIV(270), "Fireplace ventilation runtime",      true},
    {Point::kFireplaceRemaining,  AV(2038), "Remaining time fireplace ventilation", true},
    {Point::kFireplaceActive,     BV(400),  "Fireplace ventilation active",       true},
    {Point::kCookerHood,          BV(402),  "Cooker hood active",                 true},
    {Point::kAwayDelayActive,     BV(574),  "Delay for away active",              true},
    {Point::kTempVentOpRemaining, AV(2005), "Remaining time temporary ventilation op", true},
    {Point::kModeRfInput,         AV(2125), "Operating mode input from RF system", true},

    {Point::kFanSupplyHigh,       AV(1835), "Setpoint fan speed supply HIGH",     true},
    {Point::kFanSupplyHome,       AV(1836), "Setpoint fan speed supply HOME",     true},
    {Point::kFanSupplyAway,       AV(1837), "Setpoint fan speed supply AWAY",     true},
    {Point::kFanSupplyFireplace,  AV(1838), "Setpoint fan speed supply FIRE",     true},
    {Point::kFanSupplyCooker,     AV(1839), "Setpoint fan speed supply COOKER",   true},
    {Point::kFanExhaustHigh,      AV(1840), "Setpoint fan speed extract HIGH",    true},
    {Point::kFanExhaustHome,      AV(1841), "Setpoint fan speed extract HOME",    true},
    {Point::kFanExhaustAway,      AV(1842), "Setpoint fan speed extract AWAY",    true},
    {Point::kFanExhaustFireplace, AV(1843), "Setpoint fan speed extract FIRE",    true},
    {Point::kFanExhaustCooker,    AV(1844), "Setpoint fan speed extract COOKER",  true},
}};

// Read every poll, logged on change, never interpreted. Kept to correlate
// vendor-app actions with device state.
constexpr std::array<DiagnosticInfo, 36> kDiagnostics = {{
    {MSV(19),  "Actual ventilation mode"},
    {MSV(41),  "Present operating mode"},
    {MSV(43),  "Manual operation condition"},
    {MSV(44),  "Central condition trigger"},
    {MSV(45),  "Comfort condition trigger"},
    {MSV(46),  "Energy efficiency condition trigger"},
    {MSV(319), "Temporary ventilation operation"},
    {MSV(320), "Room climate op mode for room unit"},
    {MSV(328), "Room climate op mode input"},
    {MSV(386), "Operating mode output for RF"},
    {MSV(583), "Next room operating mode"},
    {MSV(584), "Room op mode determ for room unit"},
    {MSV(585), "Temporary room operating mode input"},
    {BI(82),   "Speed HIGH activate DI"},
    {BV(453),  "Temporary fireplace ventilation"},
    {BV(454),  "Temporary rapid ventilation"},
    {BV(452),  "Reset temporary ventilation operation"},
    {BV(487),  "Reset temporary rapid ventilation from RF"},
    {BV(488),  "Reset temporary fireplace ventilation from RF"},
    {BV(455),  "Room operator unit button"},
    {BV(475),  "Fireplace or fume hood input"},
    {BV(474),  "Scheduler override"},
    {BV(476),  "Backup comfort button"},
    {BV(575),  "Next operating mode"},
    {BV(409),  "Fan available for ventilation"},
    {BV(576),  "Scheduler reset/manual trigger"},
    {BV(485),  "Temporary rapid ventilation request from RF"},
    {BV(486),  "Temporary fireplace ventilation request from RF"},
    {AV(1814), "Time counter fireplace ventilation"},
    {AV(2004), "Time for temporary rapid ventilation"},
    {AV(2007), "Time for temporary fireplace ventilation"},
    {AV(1869), "Fan ventilation request"},
    {AV(1870), "Fan dehumidification request"},
    {AV(1913), "Time counter STOP"},
    {AV(1914), "Time counter AWAY"},
    {AV(1915), "Time counter HOME"},
}};

const std::map<ObjectRef, Point>& PointIndex() {
    static const std::map<ObjectRef, Point> index = [] {
        std::map<ObjectRef, Point> out;
        for (const auto& info : kPoints) {
            out.emplace(info.ref, info.point);
        }
        return out;
    }();
    return index;
}

const DiagnosticInfo* FindDiagnostic(const ObjectRef& ref) {
    for (const auto& diag : kDiagnostics) {
        if (diag.ref == ref) {
            return &diag;
        }
    }
    return nullptr;
}

} // namespace

const PointInfo& Describe(Point point) {
    return kPoints[static_cast<size_t>(point)];
}

ObjectRef RefOf(Point point) {
    return Describe(point).ref;
}

std::optional<Point> FindPoint(const ObjectRef& ref) {
    const auto& index = PointIndex();
    if (auto it = index.find(ref); it != index.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::span<const DiagnosticInfo> DiagnosticPoints() {
    return kDiagnostics;
}

const char* LabelOf(const ObjectRef& ref) {
    if (auto point = FindPoint(ref)) {
        return Describe(*point).label;
    }
    if (const auto* diag = FindDiagnostic(ref)) {
        return diag->label;
    }
    return nullptr;
}

bool ShouldLogChanges(const ObjectRef& ref) {
    if (auto point = FindPoint(ref)) {
        return Describe(*point).logChanges;
    }
    return FindDiagnostic(ref) != nullptr;
}

const std::vector<ObjectRef>& PollList() {
    static const std::vector<ObjectRef> list = [] {
        std::vector<ObjectRef> out;
        out.reserve(kPoints.size() + kDiagnostics.size());
        for (const auto& info : kPoints) {
            out.push_back(info.ref);
        }
        for (const auto& diag : kDiagnostics) {
            out.push_back(diag.ref);
        }
        return out;
    }();
    return list;
}

bool PointSnapshot::Is(Point point, int value) const {
    const auto v = Get(point);
    return v.has_value() && std::lround(*v) == value;
}

} // namespace FXN::Registry
