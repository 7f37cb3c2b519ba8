#ifndef EMUFLOW_COMMAND_H
#define EMUFLOW_COMMAND_H

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include "../common/types.h"

namespace emuflow {

enum class CommandType {
    CLICK,
    CROP_IMAGE,
    KEY_PRESS,
    HOT_KEY,
    TEXT,
    WAIT,
    REPEAT,
    GOTO,
    CONDITION
};

enum class ButtonType {
    LEFT,
    RIGHT,
    DOUBLE,
    WHEEL_UP,
    WHEEL_DOWN
};

enum class OnFailAction {
    SKIP,
    STOP,
    GOTO_LABEL
};

enum class ScanMode {
    EXACT,
    MAX_MATCH,
    GRID
};

enum class TextMode {
    PASTE,
    HUMANIZE
};

enum class WaitType {
    TIMEOUT,
    PIXEL_COLOR,
    SCREEN_CHANGE
};

enum class HotKeyOrder {
    SIMULTANEOUS,
    SEQUENCE
};

// Canonical names used by the persisted format and in logs
std::string toString(CommandType type);
std::string toString(ButtonType type);
std::string toString(OnFailAction action);
std::string toString(ScanMode mode);
std::string toString(TextMode mode);
std::string toString(WaitType type);
std::string toString(HotKeyOrder order);

// Parsers throw ConfigurationError on an unknown name
CommandType commandTypeFromString(const std::string& value);
ButtonType buttonTypeFromString(const std::string& value);
OnFailAction onFailActionFromString(const std::string& value);
ScanMode scanModeFromString(const std::string& value);
TextMode textModeFromString(const std::string& value);
WaitType waitTypeFromString(const std::string& value);
HotKeyOrder hotKeyOrderFromString(const std::string& value);

struct Command;

struct ClickParams {
    ButtonType button = ButtonType::LEFT;
    int x = 0;
    int y = 0;
    int humanizeDelayMinMs = 50;
    int humanizeDelayMaxMs = 200;
    std::optional<int> wheelDelta;
};

struct CropImageParams {
    Region region;
    Rgb targetColor;
    int tolerance = 10;
    ScanMode scanMode = ScanMode::EXACT;
    std::string outputVar = "crop_result";
};

struct KeyPressParams {
    std::string key;
    int repeat = 1;
    int delayBetweenMs = 100;
};

struct HotKeyParams {
    std::vector<std::string> keys;
    HotKeyOrder order = HotKeyOrder::SIMULTANEOUS;
};

struct TextParams {
    std::string content;
    TextMode mode = TextMode::PASTE;
    int speedMinCps = 10;
    int speedMaxCps = 30;
    std::optional<int> focusX;
    std::optional<int> focusY;
};

struct WaitParams {
    WaitType waitType = WaitType::TIMEOUT;
    double timeoutSec = 30.0;

    // PixelColor
    std::optional<int> pixelX;
    std::optional<int> pixelY;
    std::optional<Rgb> pixelColor;
    std::optional<int> pixelTolerance;

    // ScreenChange; no region means the whole display
    double screenThreshold = 0.9;
    std::optional<int> regionX1;
    std::optional<int> regionY1;
    std::optional<int> regionX2;
    std::optional<int> regionY2;

    bool hasRegion() const { return regionX1 && regionY1 && regionX2 && regionY2; }
    Region region() const { return Region(*regionX1, *regionY1, *regionX2, *regionY2); }
};

struct RepeatParams {
    int count = 0;  // 0 = bounded only by the script's max iterations
    std::optional<std::string> untilConditionExpr;
    std::vector<Command> innerCommands;
};

struct GotoParams {
    std::string targetLabel;
    std::optional<std::string> conditionExpr;
};

struct ConditionParams {
    std::string expr;
    std::optional<std::string> thenLabel;
    std::optional<std::string> elseLabel;
    std::vector<Command> nestedThen;
    std::vector<Command> nestedElse;
};

// Alternative order matches CommandType
using CommandParams = std::variant<ClickParams,
                                   CropImageParams,
                                   KeyPressParams,
                                   HotKeyParams,
                                   TextParams,
                                   WaitParams,
                                   RepeatParams,
                                   GotoParams,
                                   ConditionParams>;

/**
 * @brief One script step. Common fields plus a kind specific payload.
 */
struct Command {
    std::string id;
    std::optional<std::string> parentId;
    std::string name;
    bool enabled = true;
    OnFailAction onFail = OnFailAction::SKIP;
    std::optional<std::string> onFailLabel;
    std::vector<std::string> variablesOut;
    CommandParams params;

    CommandType type() const { return static_cast<CommandType>(params.index()); }

    // Wait, Repeat, Goto and Condition run in-process; everything else touches the target
    bool isLogic() const;

    // Children owned by a Repeat or Condition, empty for other kinds
    std::vector<const std::vector<Command>*> childLists() const;

    static Command create(const std::string& name, CommandParams params);
};

/**
 * @brief Generate a unique command id ("CMD-<timestamp>-<hex>")
 */
std::string generateCommandId();

/**
 * @brief Check the field constraints of a single command (children excluded)
 * @throws ConfigurationError describing the first violation
 */
void validateCommand(const Command& command);

} // namespace emuflow

#endif // EMUFLOW_COMMAND_H
