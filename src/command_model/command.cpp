#include "command.h"
#include "../common/error_handler.h"
#include "../common/input_validator.h"
#include <random>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <mutex>
#include <utility>

namespace emuflow {

namespace {

template <typename Enum, size_t N>
Enum parseEnum(const std::string& value, const std::pair<Enum, const char*> (&names)[N],
               const char* what) {
    for (const auto& entry : names) {
        if (value == entry.second) {
            return entry.first;
        }
    }
    throw ConfigurationError("Unknown " + std::string(what) + ": '" + value + "'", "command");
}

template <typename Enum, size_t N>
std::string formatEnum(Enum value, const std::pair<Enum, const char*> (&names)[N]) {
    for (const auto& entry : names) {
        if (value == entry.first) {
            return entry.second;
        }
    }
    return "Unknown";
}

const std::pair<CommandType, const char*> COMMAND_TYPE_NAMES[] = {
    {CommandType::CLICK, "Click"},
    {CommandType::CROP_IMAGE, "CropImage"},
    {CommandType::KEY_PRESS, "KeyPress"},
    {CommandType::HOT_KEY, "HotKey"},
    {CommandType::TEXT, "Text"},
    {CommandType::WAIT, "Wait"},
    {CommandType::REPEAT, "Repeat"},
    {CommandType::GOTO, "Goto"},
    {CommandType::CONDITION, "Condition"}
};

const std::pair<ButtonType, const char*> BUTTON_TYPE_NAMES[] = {
    {ButtonType::LEFT, "Left"},
    {ButtonType::RIGHT, "Right"},
    {ButtonType::DOUBLE, "Double"},
    {ButtonType::WHEEL_UP, "WheelUp"},
    {ButtonType::WHEEL_DOWN, "WheelDown"}
};

const std::pair<OnFailAction, const char*> ON_FAIL_NAMES[] = {
    {OnFailAction::SKIP, "Skip"},
    {OnFailAction::STOP, "Stop"},
    {OnFailAction::GOTO_LABEL, "GotoLabel"}
};

const std::pair<ScanMode, const char*> SCAN_MODE_NAMES[] = {
    {ScanMode::EXACT, "Exact"},
    {ScanMode::MAX_MATCH, "MaxMatch"},
    {ScanMode::GRID, "Grid"}
};

const std::pair<TextMode, const char*> TEXT_MODE_NAMES[] = {
    {TextMode::PASTE, "Paste"},
    {TextMode::HUMANIZE, "Humanize"}
};

const std::pair<WaitType, const char*> WAIT_TYPE_NAMES[] = {
    {WaitType::TIMEOUT, "Timeout"},
    {WaitType::PIXEL_COLOR, "PixelColor"},
    {WaitType::SCREEN_CHANGE, "ScreenChange"}
};

const std::pair<HotKeyOrder, const char*> HOTKEY_ORDER_NAMES[] = {
    {HotKeyOrder::SIMULTANEOUS, "Simultaneous"},
    {HotKeyOrder::SEQUENCE, "Sequence"}
};

[[noreturn]] void fail(const Command& command, const std::string& message) {
    throw ConfigurationError("Command '" + command.name + "' (" + toString(command.type()) + "): " + message,
                             command.id);
}

void checkTolerance(const Command& command, int tolerance, const char* field) {
    if (!InputValidator::isInRange(tolerance, 0, 255)) {
        fail(command, std::string(field) + " must be within 0..255, got " + std::to_string(tolerance));
    }
}

void checkColor(const Command& command, const Rgb& color, const char* field) {
    if (!color.isValid()) {
        fail(command, std::string(field) + " components must be within 0..255");
    }
}

void checkRange(const Command& command, int minValue, int maxValue, const char* field) {
    if (minValue < 0 || minValue > maxValue) {
        fail(command, std::string(field) + " range is invalid (" + std::to_string(minValue) + ".." +
                      std::to_string(maxValue) + ")");
    }
}

void checkRegion(const Command& command, const Region& region, const char* field) {
    if (region.x1 < 0 || region.y1 < 0 || region.x1 >= region.x2 || region.y1 >= region.y2) {
        fail(command, std::string(field) + " requires 0 <= x1 < x2 and 0 <= y1 < y2");
    }
}

void checkExpression(const Command& command, const std::string& expr, const char* field) {
    if (!InputValidator::isNotEmpty(expr)) {
        fail(command, std::string(field) + " must not be empty");
    }
}

struct ParamsValidator {
    const Command& command;

    void operator()(const ClickParams& p) const {
        checkRange(command, p.humanizeDelayMinMs, p.humanizeDelayMaxMs, "humanize delay");
        if (p.wheelDelta && *p.wheelDelta <= 0) {
            fail(command, "wheel_delta must be positive");
        }
    }

    void operator()(const CropImageParams& p) const {
        checkRegion(command, p.region, "region");
        checkColor(command, p.targetColor, "target_color");
        checkTolerance(command, p.tolerance, "tolerance");
        if (!InputValidator::isNotEmpty(p.outputVar)) {
            fail(command, "output_var must not be empty");
        }
    }

    void operator()(const KeyPressParams& p) const {
        if (!InputValidator::isNotEmpty(p.key)) {
            fail(command, "key must not be empty");
        }
        if (p.repeat < 1) {
            fail(command, "repeat must be at least 1");
        }
        if (!InputValidator::isNonNegative(p.delayBetweenMs)) {
            fail(command, "delay_between_ms must not be negative");
        }
    }

    void operator()(const HotKeyParams& p) const {
        if (p.keys.empty()) {
            fail(command, "keys must not be empty");
        }
        for (const auto& key : p.keys) {
            if (!InputValidator::isNotEmpty(key)) {
                fail(command, "keys must not contain empty names");
            }
        }
    }

    void operator()(const TextParams& p) const {
        if (p.focusX.has_value() != p.focusY.has_value()) {
            fail(command, "focus_x and focus_y must be given together");
        }
        if (p.mode == TextMode::HUMANIZE) {
            if (p.speedMinCps < 1 || p.speedMinCps > p.speedMaxCps) {
                fail(command, "speed range is invalid (" + std::to_string(p.speedMinCps) + ".." +
                              std::to_string(p.speedMaxCps) + ")");
            }
        }
    }

    void operator()(const WaitParams& p) const {
        if (!(p.timeoutSec > 0.0)) {
            fail(command, "timeout_sec must be positive");
        }
        switch (p.waitType) {
            case WaitType::TIMEOUT:
                break;
            case WaitType::PIXEL_COLOR:
                if (!p.pixelX || !p.pixelY || !p.pixelColor) {
                    fail(command, "PixelColor wait requires pixel_x, pixel_y and pixel_color");
                }
                if (*p.pixelX < 0 || *p.pixelY < 0) {
                    fail(command, "pixel coordinates must not be negative");
                }
                checkColor(command, *p.pixelColor, "pixel_color");
                if (p.pixelTolerance) {
                    checkTolerance(command, *p.pixelTolerance, "pixel_tolerance");
                }
                break;
            case WaitType::SCREEN_CHANGE: {
                if (!(p.screenThreshold > 0.0 && p.screenThreshold <= 1.0)) {
                    fail(command, "screen_threshold must be within (0, 1]");
                }
                bool any = p.regionX1 || p.regionY1 || p.regionX2 || p.regionY2;
                if (any && !p.hasRegion()) {
                    fail(command, "region_x1..region_y2 must be given together");
                }
                if (p.hasRegion()) {
                    checkRegion(command, p.region(), "region");
                }
                break;
            }
        }
    }

    void operator()(const RepeatParams& p) const {
        if (p.count < 0) {
            fail(command, "count must not be negative");
        }
        if (p.untilConditionExpr) {
            checkExpression(command, *p.untilConditionExpr, "until_condition_expr");
        }
    }

    void operator()(const GotoParams& p) const {
        if (!InputValidator::isNotEmpty(p.targetLabel)) {
            fail(command, "target_label must not be empty");
        }
        if (p.conditionExpr) {
            checkExpression(command, *p.conditionExpr, "condition_expr");
        }
    }

    void operator()(const ConditionParams& p) const {
        checkExpression(command, p.expr, "expr");
        if (p.thenLabel && !InputValidator::isNotEmpty(*p.thenLabel)) {
            fail(command, "then_label must not be empty when set");
        }
        if (p.elseLabel && !InputValidator::isNotEmpty(*p.elseLabel)) {
            fail(command, "else_label must not be empty when set");
        }
    }
};

} // anonymous namespace

std::string toString(CommandType type) { return formatEnum(type, COMMAND_TYPE_NAMES); }
std::string toString(ButtonType type) { return formatEnum(type, BUTTON_TYPE_NAMES); }
std::string toString(OnFailAction action) { return formatEnum(action, ON_FAIL_NAMES); }
std::string toString(ScanMode mode) { return formatEnum(mode, SCAN_MODE_NAMES); }
std::string toString(TextMode mode) { return formatEnum(mode, TEXT_MODE_NAMES); }
std::string toString(WaitType type) { return formatEnum(type, WAIT_TYPE_NAMES); }
std::string toString(HotKeyOrder order) { return formatEnum(order, HOTKEY_ORDER_NAMES); }

CommandType commandTypeFromString(const std::string& value) {
    return parseEnum(value, COMMAND_TYPE_NAMES, "command type");
}

ButtonType buttonTypeFromString(const std::string& value) {
    return parseEnum(value, BUTTON_TYPE_NAMES, "button type");
}

OnFailAction onFailActionFromString(const std::string& value) {
    return parseEnum(value, ON_FAIL_NAMES, "on_fail action");
}

ScanMode scanModeFromString(const std::string& value) {
    return parseEnum(value, SCAN_MODE_NAMES, "scan mode");
}

TextMode textModeFromString(const std::string& value) {
    return parseEnum(value, TEXT_MODE_NAMES, "text mode");
}

WaitType waitTypeFromString(const std::string& value) {
    return parseEnum(value, WAIT_TYPE_NAMES, "wait type");
}

HotKeyOrder hotKeyOrderFromString(const std::string& value) {
    return parseEnum(value, HOTKEY_ORDER_NAMES, "hotkey order");
}

bool Command::isLogic() const {
    switch (type()) {
        case CommandType::WAIT:
        case CommandType::REPEAT:
        case CommandType::GOTO:
        case CommandType::CONDITION:
            return true;
        default:
            return false;
    }
}

std::vector<const std::vector<Command>*> Command::childLists() const {
    std::vector<const std::vector<Command>*> lists;
    if (const auto* repeat = std::get_if<RepeatParams>(&params)) {
        lists.push_back(&repeat->innerCommands);
    } else if (const auto* condition = std::get_if<ConditionParams>(&params)) {
        lists.push_back(&condition->nestedThen);
        lists.push_back(&condition->nestedElse);
    }
    return lists;
}

Command Command::create(const std::string& name, CommandParams params) {
    Command command;
    command.id = generateCommandId();
    command.name = name;
    command.params = std::move(params);
    return command;
}

std::string generateCommandId() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::mutex genMutex;
    static const char* hexChars = "0123456789abcdef";

    std::stringstream ss;
    ss << "CMD-";

    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    ss << std::hex << millis << std::dec << "-";

    std::lock_guard<std::mutex> lock(genMutex);
    for (int i = 0; i < 12; ++i) {
        ss << hexChars[dis(gen)];
    }

    return ss.str();
}

void validateCommand(const Command& command) {
    if (!InputValidator::isNotEmpty(command.id)) {
        throw ConfigurationError("Command '" + command.name + "' has an empty id", "command");
    }
    if (!InputValidator::isNotEmpty(command.name)) {
        throw ConfigurationError("Command " + command.id + " has an empty name", command.id);
    }
    if (command.onFail == OnFailAction::GOTO_LABEL &&
        (!command.onFailLabel || !InputValidator::isNotEmpty(*command.onFailLabel))) {
        fail(command, "on_fail GotoLabel requires on_fail_label");
    }
    for (const auto& key : command.variablesOut) {
        if (!InputValidator::isNotEmpty(key)) {
            fail(command, "variables_out must not contain empty keys");
        }
    }

    std::visit(ParamsValidator{command}, command.params);
}

} // namespace emuflow
