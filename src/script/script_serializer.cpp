#include "script_serializer.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include "../common/file_utils.h"
#include <cmath>
#include <limits>

namespace emuflow {

namespace {

using nlohmann::json;

// Field readers: a missing or null field yields the default, a field of the
// wrong type is a ConfigurationError.

const json* field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

[[noreturn]] void badField(const std::string& where, const char* key, const std::string& expected) {
    throw ConfigurationError(where + "." + key + " must be " + expected, "script");
}

std::optional<int> optionalInt(const json& object, const char* key, const std::string& where) {
    const json* value = field(object, key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_number_integer()) {
        auto raw = value->get<int64_t>();
        if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
            badField(where, key, "within the int range");
        }
        return static_cast<int>(raw);
    }
    // Whole floats such as 5.0 are accepted
    if (value->is_number_float()) {
        double raw = value->get<double>();
        if (std::floor(raw) == raw && std::fabs(raw) <= std::numeric_limits<int>::max()) {
            return static_cast<int>(raw);
        }
    }
    badField(where, key, "an integer");
}

int intField(const json& object, const char* key, int defaultValue, const std::string& where) {
    return optionalInt(object, key, where).value_or(defaultValue);
}

double doubleField(const json& object, const char* key, double defaultValue, const std::string& where) {
    const json* value = field(object, key);
    if (!value) {
        return defaultValue;
    }
    if (!value->is_number()) {
        badField(where, key, "a number");
    }
    return value->get<double>();
}

bool boolField(const json& object, const char* key, bool defaultValue, const std::string& where) {
    const json* value = field(object, key);
    if (!value) {
        return defaultValue;
    }
    if (!value->is_boolean()) {
        badField(where, key, "a boolean");
    }
    return value->get<bool>();
}

std::optional<std::string> optionalString(const json& object, const char* key, const std::string& where) {
    const json* value = field(object, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        badField(where, key, "a string");
    }
    return value->get<std::string>();
}

std::string stringField(const json& object, const char* key, const std::string& defaultValue,
                        const std::string& where) {
    return optionalString(object, key, where).value_or(defaultValue);
}

std::vector<std::string> stringList(const json& object, const char* key, const std::string& where) {
    const json* value = field(object, key);
    std::vector<std::string> items;
    if (!value) {
        return items;
    }
    if (!value->is_array()) {
        badField(where, key, "an array of strings");
    }
    for (const auto& item : *value) {
        if (!item.is_string()) {
            badField(where, key, "an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

// Colors are [r, g, b]; {"r","g","b"} objects are accepted on input
std::optional<Rgb> optionalColor(const json& object, const char* key, const std::string& where) {
    const json* value = field(object, key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_array() && value->size() == 3 && (*value)[0].is_number_integer() &&
        (*value)[1].is_number_integer() && (*value)[2].is_number_integer()) {
        return Rgb((*value)[0].get<int>(), (*value)[1].get<int>(), (*value)[2].get<int>());
    }
    if (value->is_object() && value->contains("r") && value->contains("g") && value->contains("b")) {
        std::string colorWhere = where + "." + key;
        return Rgb(intField(*value, "r", 0, colorWhere),
                   intField(*value, "g", 0, colorWhere),
                   intField(*value, "b", 0, colorWhere));
    }
    badField(where, key, "an [r, g, b] array");
}

json colorToJson(const Rgb& color) {
    return json::array({color.r, color.g, color.b});
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json timeoutToJson(double seconds) {
    if (std::floor(seconds) == seconds && std::fabs(seconds) < 1e9) {
        return static_cast<int64_t>(seconds);
    }
    return seconds;
}

std::vector<Command> commandList(const json& object, const char* key, const std::string& where) {
    std::vector<Command> commands;
    const json* value = field(object, key);
    if (!value) {
        return commands;
    }
    if (!value->is_array()) {
        badField(where, key, "an array of commands");
    }
    for (size_t i = 0; i < value->size(); ++i) {
        commands.push_back(ScriptSerializer::commandFromJson(
            (*value)[i], where + "." + key + "[" + std::to_string(i) + "]"));
    }
    return commands;
}

json commandListToJson(const std::vector<Command>& commands) {
    json list = json::array();
    for (const auto& command : commands) {
        list.push_back(ScriptSerializer::commandToJson(command));
    }
    return list;
}

// Nested commands written without an explicit parent_id get their owner's id
void adoptChildren(std::vector<Command>& children, const std::string& parentId) {
    for (auto& child : children) {
        if (!child.parentId) {
            child.parentId = parentId;
        }
    }
}

struct ParamsWriter {
    json& out;

    void operator()(const ClickParams& p) const {
        out["button_type"] = toString(p.button);
        out["x"] = p.x;
        out["y"] = p.y;
        out["humanize_delay_min_ms"] = p.humanizeDelayMinMs;
        out["humanize_delay_max_ms"] = p.humanizeDelayMaxMs;
        out["wheel_delta"] = optionalToJson(p.wheelDelta);
    }

    void operator()(const CropImageParams& p) const {
        out["x1"] = p.region.x1;
        out["y1"] = p.region.y1;
        out["x2"] = p.region.x2;
        out["y2"] = p.region.y2;
        out["target_color"] = colorToJson(p.targetColor);
        out["tolerance"] = p.tolerance;
        out["scan_mode"] = toString(p.scanMode);
        out["output_var"] = p.outputVar;
    }

    void operator()(const KeyPressParams& p) const {
        out["key"] = p.key;
        out["repeat"] = p.repeat;
        out["delay_between_ms"] = p.delayBetweenMs;
    }

    void operator()(const HotKeyParams& p) const {
        out["keys"] = p.keys;
        out["hotkey_order"] = toString(p.order);
    }

    void operator()(const TextParams& p) const {
        out["content"] = p.content;
        out["text_mode"] = toString(p.mode);
        out["speed_min_cps"] = p.speedMinCps;
        out["speed_max_cps"] = p.speedMaxCps;
        out["focus_x"] = optionalToJson(p.focusX);
        out["focus_y"] = optionalToJson(p.focusY);
    }

    void operator()(const WaitParams& p) const {
        out["wait_type"] = toString(p.waitType);
        out["timeout_sec"] = timeoutToJson(p.timeoutSec);
        out["pixel_x"] = optionalToJson(p.pixelX);
        out["pixel_y"] = optionalToJson(p.pixelY);
        out["pixel_color"] = p.pixelColor ? colorToJson(*p.pixelColor) : json(nullptr);
        out["pixel_tolerance"] = optionalToJson(p.pixelTolerance);
        out["screen_threshold"] = p.screenThreshold;
        out["region_x1"] = optionalToJson(p.regionX1);
        out["region_y1"] = optionalToJson(p.regionY1);
        out["region_x2"] = optionalToJson(p.regionX2);
        out["region_y2"] = optionalToJson(p.regionY2);
    }

    void operator()(const RepeatParams& p) const {
        out["count"] = p.count;
        out["until_condition_expr"] = optionalToJson(p.untilConditionExpr);
        out["inner_commands"] = commandListToJson(p.innerCommands);
    }

    void operator()(const GotoParams& p) const {
        out["target_label"] = p.targetLabel;
        out["condition_expr"] = optionalToJson(p.conditionExpr);
    }

    void operator()(const ConditionParams& p) const {
        out["expr"] = p.expr;
        out["then_label"] = optionalToJson(p.thenLabel);
        out["else_label"] = optionalToJson(p.elseLabel);
        out["nested_then"] = commandListToJson(p.nestedThen);
        out["nested_else"] = commandListToJson(p.nestedElse);
    }
};

CommandParams paramsFromJson(CommandType type, const json& j, const std::string& where) {
    switch (type) {
        case CommandType::CLICK: {
            ClickParams p;
            p.button = buttonTypeFromString(stringField(j, "button_type", "Left", where));
            p.x = intField(j, "x", 0, where);
            p.y = intField(j, "y", 0, where);
            p.humanizeDelayMinMs = intField(j, "humanize_delay_min_ms", 50, where);
            p.humanizeDelayMaxMs = intField(j, "humanize_delay_max_ms", 200, where);
            p.wheelDelta = optionalInt(j, "wheel_delta", where);
            return p;
        }
        case CommandType::CROP_IMAGE: {
            CropImageParams p;
            p.region = Region(intField(j, "x1", 0, where), intField(j, "y1", 0, where),
                              intField(j, "x2", 0, where), intField(j, "y2", 0, where));
            p.targetColor = optionalColor(j, "target_color", where).value_or(Rgb(0, 0, 0));
            p.tolerance = intField(j, "tolerance", 10, where);
            p.scanMode = scanModeFromString(stringField(j, "scan_mode", "Exact", where));
            p.outputVar = stringField(j, "output_var", "crop_result", where);
            return p;
        }
        case CommandType::KEY_PRESS: {
            KeyPressParams p;
            p.key = stringField(j, "key", "", where);
            p.repeat = intField(j, "repeat", 1, where);
            p.delayBetweenMs = intField(j, "delay_between_ms", 100, where);
            return p;
        }
        case CommandType::HOT_KEY: {
            HotKeyParams p;
            p.keys = stringList(j, "keys", where);
            p.order = hotKeyOrderFromString(stringField(j, "hotkey_order", "Simultaneous", where));
            return p;
        }
        case CommandType::TEXT: {
            TextParams p;
            p.content = stringField(j, "content", "", where);
            p.mode = textModeFromString(stringField(j, "text_mode", "Paste", where));
            p.speedMinCps = intField(j, "speed_min_cps", 10, where);
            p.speedMaxCps = intField(j, "speed_max_cps", 30, where);
            p.focusX = optionalInt(j, "focus_x", where);
            p.focusY = optionalInt(j, "focus_y", where);
            return p;
        }
        case CommandType::WAIT: {
            WaitParams p;
            p.waitType = waitTypeFromString(stringField(j, "wait_type", "Timeout", where));
            p.timeoutSec = doubleField(j, "timeout_sec", 30.0, where);
            p.pixelX = optionalInt(j, "pixel_x", where);
            p.pixelY = optionalInt(j, "pixel_y", where);
            p.pixelColor = optionalColor(j, "pixel_color", where);
            p.pixelTolerance = optionalInt(j, "pixel_tolerance", where);
            p.screenThreshold = doubleField(j, "screen_threshold", 0.9, where);
            p.regionX1 = optionalInt(j, "region_x1", where);
            p.regionY1 = optionalInt(j, "region_y1", where);
            p.regionX2 = optionalInt(j, "region_x2", where);
            p.regionY2 = optionalInt(j, "region_y2", where);
            return p;
        }
        case CommandType::REPEAT: {
            RepeatParams p;
            p.count = intField(j, "count", 0, where);
            p.untilConditionExpr = optionalString(j, "until_condition_expr", where);
            p.innerCommands = commandList(j, "inner_commands", where);
            return p;
        }
        case CommandType::GOTO: {
            GotoParams p;
            p.targetLabel = stringField(j, "target_label", "", where);
            p.conditionExpr = optionalString(j, "condition_expr", where);
            return p;
        }
        case CommandType::CONDITION: {
            ConditionParams p;
            p.expr = stringField(j, "expr", "", where);
            p.thenLabel = optionalString(j, "then_label", where);
            p.elseLabel = optionalString(j, "else_label", where);
            p.nestedThen = commandList(j, "nested_then", where);
            p.nestedElse = commandList(j, "nested_else", where);
            return p;
        }
    }
    throw ConfigurationError(where + ": unhandled command type", "script");
}

} // anonymous namespace

Command ScriptSerializer::commandFromJson(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw ConfigurationError(where + " must be an object", "script");
    }

    auto typeName = optionalString(j, "type", where);
    if (!typeName) {
        throw ConfigurationError(where + " is missing 'type'", "script");
    }
    auto name = optionalString(j, "name", where);
    if (!name) {
        throw ConfigurationError(where + " is missing 'name'", "script");
    }

    Command command;
    command.id = stringField(j, "id", "", where);
    if (command.id.empty()) {
        command.id = generateCommandId();
    }
    command.parentId = optionalString(j, "parent_id", where);
    command.name = *name;
    command.enabled = boolField(j, "enabled", true, where);
    command.onFail = onFailActionFromString(stringField(j, "on_fail", "Skip", where));
    command.onFailLabel = optionalString(j, "on_fail_label", where);
    command.variablesOut = stringList(j, "variables_out", where);
    command.params = paramsFromJson(commandTypeFromString(*typeName), j, where + " '" + *name + "'");

    if (auto* repeat = std::get_if<RepeatParams>(&command.params)) {
        adoptChildren(repeat->innerCommands, command.id);
    } else if (auto* condition = std::get_if<ConditionParams>(&command.params)) {
        adoptChildren(condition->nestedThen, command.id);
        adoptChildren(condition->nestedElse, command.id);
    }

    return command;
}

json ScriptSerializer::commandToJson(const Command& command) {
    json out = {
        {"id", command.id},
        {"parent_id", optionalToJson(command.parentId)},
        {"name", command.name},
        {"type", toString(command.type())},
        {"enabled", command.enabled},
        {"on_fail", toString(command.onFail)},
        {"on_fail_label", optionalToJson(command.onFailLabel)},
        {"variables_out", command.variablesOut}
    };
    std::visit(ParamsWriter{out}, command.params);
    return out;
}

Script ScriptSerializer::fromJson(const json& document, int defaultMaxIterations) {
    if (!document.is_object()) {
        throw ConfigurationError("Script document must be a JSON object", "script");
    }

    int version = intField(document, "version", FORMAT_VERSION, "script");
    if (version != FORMAT_VERSION) {
        throw ConfigurationError("Unsupported script version " + std::to_string(version), "script");
    }

    const json* sequenceJson = field(document, "sequence");
    if (sequenceJson && !sequenceJson->is_array()) {
        throw ConfigurationError("script.sequence must be an array", "script");
    }
    std::vector<Command> sequence = commandList(document, "sequence", "script");

    json variables = json::object();
    if (const json* value = field(document, "variables_global")) {
        if (!value->is_object()) {
            throw ConfigurationError("script.variables_global must be an object", "script");
        }
        variables = *value;
    }

    int maxIterations = intField(document, "max_iterations", defaultMaxIterations, "script");

    std::optional<Command> handler;
    if (const json* value = field(document, "on_error_handler")) {
        handler = commandFromJson(*value, "script.on_error_handler");
    }

    return Script(std::move(sequence), std::move(variables), maxIterations, std::move(handler));
}

json ScriptSerializer::toJson(const Script& script) {
    return json{
        {"version", FORMAT_VERSION},
        {"max_iterations", script.maxIterations()},
        {"variables_global", script.variablesGlobal()},
        {"sequence", commandListToJson(script.sequence())},
        {"on_error_handler", script.onErrorHandler() ? commandToJson(*script.onErrorHandler()) : json(nullptr)}
    };
}

Script ScriptSerializer::loadFromFile(const std::string& path, int defaultMaxIterations) {
    json document;
    std::string error;
    if (!utils::FileUtils::loadJsonFromFile(path, document, &error)) {
        throw ConfigurationError("Cannot load script " + path + ": " + error, "script");
    }

    Script script = fromJson(document, defaultMaxIterations);
    SLOG_INFO().message("Script loaded")
        .context("path", path)
        .context("commands", script.commandCount())
        .context("max_iterations", script.maxIterations());
    return script;
}

bool ScriptSerializer::saveToFile(const Script& script, const std::string& path) {
    if (!utils::FileUtils::saveJsonToFile(path, toJson(script))) {
        SLOG_ERROR().message("Failed to save script").context("path", path);
        return false;
    }
    SLOG_DEBUG().message("Script saved").context("path", path);
    return true;
}

} // namespace emuflow
