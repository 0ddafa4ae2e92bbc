#include "mtqdesign/record_io.hpp"

#include "mtqdesign/errors.hpp"

#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mtqdesign {
namespace {

using nlohmann::json;

const json& requireField(const json& parent, const std::string& path, const std::string& key) {
    if (!parent.is_object() || !parent.contains(key)) {
        throw ConfigError("Design record missing field: " + path + key);
    }
    return parent.at(key);
}

double readNumber(const json& parent, const std::string& path, const std::string& key) {
    const auto& value = requireField(parent, path, key);
    if (!value.is_number()) {
        throw ConfigError("Design record field " + path + key + " must be a number");
    }
    return value.get<double>();
}

long long readInteger(const json& parent, const std::string& path, const std::string& key) {
    const auto& value = requireField(parent, path, key);
    if (!value.is_number_integer()) {
        throw ConfigError("Design record field " + path + key + " must be an integer");
    }
    return value.get<long long>();
}

json rectToJson(const DesignRecord::Rect& rect) {
    return json{{"length", rect.length}, {"width", rect.width}};
}

DesignRecord::Rect rectFromJson(const json& parent, const std::string& path) {
    DesignRecord::Rect rect{};
    rect.length = readNumber(parent, path, "length");
    rect.width = readNumber(parent, path, "width");
    return rect;
}

}  // namespace

json designRecordToJson(const DesignRecord& record) {
    json out;
    out["status"] = record.status;
    out["dimensions"] = {{"inner", rectToJson(record.inner)}, {"outer", rectToJson(record.outer)}};
    out["traces"] = {
        {"width", record.traces.width},
        {"spacing", record.traces.spacing},
        {"turns_per_layer", record.traces.turnsPerLayer},
        {"total_layers", record.traces.totalLayers},
        {"total_length", record.traces.totalLength},
    };
    out["electrical"] = {
        {"resistance", record.electrical.resistance},
        {"voltage", record.electrical.voltage},
        {"current", record.electrical.current},
        {"power", record.electrical.power},
        {"current_density", record.electrical.currentDensity},
        {"inductance", record.electrical.inductance},
    };

    json thermal = json::object();
    for (const auto& environment : record.thermal) {
        thermal[environment.name] = {
            {"ambient", environment.ambient},
            {"temperature_rise", environment.temperatureRise},
            {"final_temperature", environment.finalTemperature},
        };
    }
    out["thermal"] = thermal;

    out["performance"] = {{"magnetic_moment", record.magneticMoment}};
    out["dynamics"] = {
        {"inductance", record.dynamics.inductance},
        {"time_constant", record.dynamics.timeConstant},
        {"time_to_99_percent", record.dynamics.timeTo99Percent},
        {"max_moment_99_percent", record.dynamics.maxMoment99Percent},
    };
    out["optimization"] = {
        {"samples", record.optimization.samples},
        {"feasible_samples", record.optimization.feasibleSamples},
        {"limiting_current", record.optimization.limitingCurrent},
        {"refined", record.optimization.refined},
    };
    return out;
}

DesignRecord designRecordFromJson(const json& in) {
    DesignRecord record{};
    const auto& status = requireField(in, "", "status");
    if (!status.is_string()) {
        throw ConfigError("Design record field status must be a string");
    }
    record.status = status.get<std::string>();

    const auto& dimensions = requireField(in, "", "dimensions");
    record.inner = rectFromJson(requireField(dimensions, "dimensions.", "inner"), "dimensions.inner.");
    record.outer = rectFromJson(requireField(dimensions, "dimensions.", "outer"), "dimensions.outer.");

    const auto& traces = requireField(in, "", "traces");
    record.traces.width = readNumber(traces, "traces.", "width");
    record.traces.spacing = readNumber(traces, "traces.", "spacing");
    record.traces.turnsPerLayer = readInteger(traces, "traces.", "turns_per_layer");
    record.traces.totalLayers = readInteger(traces, "traces.", "total_layers");
    record.traces.totalLength = readNumber(traces, "traces.", "total_length");

    const auto& electrical = requireField(in, "", "electrical");
    record.electrical.resistance = readNumber(electrical, "electrical.", "resistance");
    record.electrical.voltage = readNumber(electrical, "electrical.", "voltage");
    record.electrical.current = readNumber(electrical, "electrical.", "current");
    record.electrical.power = readNumber(electrical, "electrical.", "power");
    record.electrical.currentDensity = readNumber(electrical, "electrical.", "current_density");
    record.electrical.inductance = readNumber(electrical, "electrical.", "inductance");

    const auto& thermal = requireField(in, "", "thermal");
    if (!thermal.is_object()) {
        throw ConfigError("Design record field thermal must be an object");
    }
    // Space first, then ground test, matching the order the analyzer emits.
    for (const char* name : {"space", "ground_test"}) {
        if (!thermal.contains(name)) {
            continue;
        }
        const std::string path = std::string("thermal.") + name + ".";
        const auto& entry = thermal.at(name);
        DesignRecord::Environment environment{};
        environment.name = name;
        environment.ambient = readNumber(entry, path, "ambient");
        environment.temperatureRise = readNumber(entry, path, "temperature_rise");
        environment.finalTemperature = readNumber(entry, path, "final_temperature");
        record.thermal.push_back(environment);
    }

    record.magneticMoment =
        readNumber(requireField(in, "", "performance"), "performance.", "magnetic_moment");

    if (in.contains("dynamics")) {
        const auto& dynamics = in.at("dynamics");
        record.dynamics.inductance = readNumber(dynamics, "dynamics.", "inductance");
        record.dynamics.timeConstant = readNumber(dynamics, "dynamics.", "time_constant");
        record.dynamics.timeTo99Percent = readNumber(dynamics, "dynamics.", "time_to_99_percent");
        record.dynamics.maxMoment99Percent = readNumber(dynamics, "dynamics.", "max_moment_99_percent");
    }

    if (in.contains("optimization")) {
        const auto& optimization = in.at("optimization");
        record.optimization.samples = readInteger(optimization, "optimization.", "samples");
        record.optimization.feasibleSamples = readInteger(optimization, "optimization.", "feasible_samples");
        record.optimization.limitingCurrent = optimization.value("limiting_current", std::string{"none"});
        record.optimization.refined = optimization.value("refined", false);
    }
    return record;
}

void writeDesignRecord(const std::string& path, const DesignRecord& record) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open design record output: " + path);
    }
    ofs << designRecordToJson(record).dump(2) << '\n';
}

DesignRecord readDesignRecord(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("Failed to open design record: " + path);
    }
    json in;
    try {
        input >> in;
    } catch (const json::parse_error& ex) {
        throw ConfigError("Malformed JSON in " + path + ": " + ex.what());
    }
    return designRecordFromJson(in);
}

std::string formatDesignSummary(const DesignRecord& record) {
    std::ostringstream oss;
    oss << std::fixed;
    if (record.status != "ok") {
        oss << "No feasible design found within the manufacturing limits.\n";
    }

    oss << "Dimensions:\n"
        << std::setprecision(1) << "  Outer: " << record.outer.length << "mm x " << record.outer.width << "mm\n"
        << "  Inner: " << record.inner.length << "mm x " << record.inner.width << "mm\n";

    oss << "\nTrace Design:\n"
        << std::setprecision(3) << "  Width: " << record.traces.width << "mm\n"
        << "  Spacing: " << record.traces.spacing << "mm\n"
        << "  Turns per layer: " << record.traces.turnsPerLayer << '\n'
        << "  Total layers: " << record.traces.totalLayers << '\n'
        << std::setprecision(2) << "  Total length: " << record.traces.totalLength << "m\n";

    oss << "\nElectrical Properties:\n"
        << std::setprecision(2) << "  Resistance: " << record.electrical.resistance << " ohm\n"
        << std::setprecision(1) << "  Voltage: " << record.electrical.voltage << "V\n"
        << std::setprecision(3) << "  Current: " << record.electrical.current << "A ("
        << record.optimization.limitingCurrent << " limited)\n"
        << std::setprecision(2) << "  Current density: " << record.electrical.currentDensity << "A/mm^2\n"
        << "  Power: " << record.electrical.power << "W\n";

    oss << "\nThermal Analysis:\n";
    for (const auto& environment : record.thermal) {
        oss << "  " << environment.name << ":\n"
            << std::setprecision(1) << "    Ambient: " << environment.ambient << "C\n"
            << "    Rise: " << environment.temperatureRise << "C\n"
            << "    Final: " << environment.finalTemperature << "C\n";
    }

    oss << "\nDynamics Analysis:\n"
        << std::setprecision(1) << "  Inductance: " << record.dynamics.inductance << "uH\n"
        << std::setprecision(3) << "  Time constant: " << record.dynamics.timeConstant << "ms\n"
        << "  Time to 99% of magnetic moment: " << record.dynamics.timeTo99Percent << "ms\n"
        << std::setprecision(4) << "  99% of magnetic moment: " << record.dynamics.maxMoment99Percent
        << " A m^2\n";

    oss << "\nPerformance:\n"
        << std::setprecision(4) << "  Magnetic moment: " << record.magneticMoment << " A m^2\n";
    return oss.str();
}

}  // namespace mtqdesign
