#include "ParameterFile.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

namespace ecodyn {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const std::size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    const std::size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool parseDouble(const std::string& text, double* out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size()) return false;
    *out = v;
    return true;
}

bool parseBool(const std::string& text, bool* out) {
    if (text == "true" || text == "1" || text == "yes") { *out = true; return true; }
    if (text == "false" || text == "0" || text == "no") { *out = false; return true; }
    return false;
}

void setError(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

// Keys in file order; the block prefix groups them.
const char* const kRequiredKeys[] = {
    "prey.initial_population",
    "prey.birth_rate",
    "prey.carrying_capacity",
    "predator.initial_population",
    "predator.hunting_efficiency",
    "predator.death_rate",
    "environment.resource_availability",
    "environment.seasonal_variation",
    "environment.seasonal_amplitude",
};

constexpr const char* kHorizonKey = "run.horizon";

double* numericField(SimulationParameters& p, const std::string& key) {
    if (key == "prey.initial_population")           return &p.prey.initial_population;
    if (key == "prey.birth_rate")                   return &p.prey.birth_rate;
    if (key == "prey.carrying_capacity")            return &p.prey.carrying_capacity;
    if (key == "predator.initial_population")       return &p.predator.initial_population;
    if (key == "predator.hunting_efficiency")       return &p.predator.hunting_efficiency;
    if (key == "predator.death_rate")               return &p.predator.death_rate;
    if (key == "environment.resource_availability") return &p.environment.resource_availability;
    if (key == "environment.seasonal_amplitude")    return &p.environment.seasonal_amplitude;
    return nullptr;
}

} // namespace

EngineStatus parseParameterText(const std::string& text, ParameterFile* out, std::string* error) {
    if (!out) return EngineStatus::InvalidParameters;

    std::map<std::string, std::pair<std::string, int>> config;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        const std::size_t eq = stripped.find('=');
        if (eq == std::string::npos) {
            setError(error, "line " + std::to_string(line_no) + ": expected key = value");
            return EngineStatus::InvalidParameters;
        }
        const std::string key = trim(stripped.substr(0, eq));
        const std::string value = trim(stripped.substr(eq + 1));
        if (config.count(key)) {
            setError(error, "line " + std::to_string(line_no) + ": duplicate key '" + key + "'");
            return EngineStatus::InvalidParameters;
        }
        config[key] = {value, line_no};
    }

    ParameterFile parsed;
    for (const char* key : kRequiredKeys) {
        if (!config.count(key)) {
            setError(error, std::string("missing required key '") + key + "'");
            return EngineStatus::InvalidParameters;
        }
    }

    for (const auto& kv : config) {
        const std::string& key = kv.first;
        const std::string& value = kv.second.first;
        const std::string where = "line " + std::to_string(kv.second.second) + ": ";

        if (key == "environment.seasonal_variation") {
            if (!parseBool(value, &parsed.parameters.environment.seasonal_variation)) {
                setError(error, where + "'" + key + "' expects true/false");
                return EngineStatus::InvalidParameters;
            }
        } else if (key == kHorizonKey) {
            if (!parseDouble(value, &parsed.horizon)) {
                setError(error, where + "'" + key + "' is not a number");
                return EngineStatus::InvalidParameters;
            }
        } else if (double* field = numericField(parsed.parameters, key)) {
            if (!parseDouble(value, field)) {
                setError(error, where + "'" + key + "' is not a number");
                return EngineStatus::InvalidParameters;
            }
        } else {
            setError(error, where + "unknown key '" + key + "'");
            return EngineStatus::InvalidParameters;
        }
    }

    const EngineStatus st = validateParameters(parsed.parameters);
    if (st != EngineStatus::Ok) {
        setError(error, std::string("parameter set rejected: ") + statusName(st));
        return st;
    }
    if (!std::isfinite(parsed.horizon) || parsed.horizon <= 0.0) {
        setError(error, std::string("'") + kHorizonKey + "' must be positive");
        return EngineStatus::InvalidParameters;
    }

    *out = parsed;
    return EngineStatus::Ok;
}

EngineStatus loadParameterFile(const std::string& path, ParameterFile* out, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        setError(error, "cannot open '" + path + "'");
        return EngineStatus::InvalidParameters;
    }
    std::ostringstream buf;
    buf << file.rdbuf();
    return parseParameterText(buf.str(), out, error);
}

std::string formatParameterText(const SimulationParameters& p, double horizon) {
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    out << "# prey\n"
        << "prey.initial_population = " << p.prey.initial_population << '\n'
        << "prey.birth_rate = " << p.prey.birth_rate << '\n'
        << "prey.carrying_capacity = " << p.prey.carrying_capacity << '\n'
        << "# predator\n"
        << "predator.initial_population = " << p.predator.initial_population << '\n'
        << "predator.hunting_efficiency = " << p.predator.hunting_efficiency << '\n'
        << "predator.death_rate = " << p.predator.death_rate << '\n'
        << "# environment\n"
        << "environment.resource_availability = " << p.environment.resource_availability << '\n'
        << "environment.seasonal_variation = " << (p.environment.seasonal_variation ? "true" : "false") << '\n'
        << "environment.seasonal_amplitude = " << p.environment.seasonal_amplitude << '\n'
        << "# run\n"
        << kHorizonKey << " = " << horizon << '\n';
    return out.str();
}

} // namespace ecodyn
