#ifndef __LGNC_REMOTE_COMMANDS__
#define __LGNC_REMOTE_COMMANDS__

#include "Headers.hpp"

namespace lgnc {
/**
 * @brief Key codes understood by the HandleKeyInput handler.
 *
 * Each value is the number of a remote control button. The client sends
 * whatever integer it is given, so firmware specific codes that are missing
 * here can still be used.
 */
enum RemoteCommand : int {
  CMD_POWER = 1,
  CMD_NUMBER_0 = 2,
  CMD_NUMBER_1 = 3,
  CMD_NUMBER_2 = 4,
  CMD_NUMBER_3 = 5,
  CMD_NUMBER_4 = 6,
  CMD_NUMBER_5 = 7,
  CMD_NUMBER_6 = 8,
  CMD_NUMBER_7 = 9,
  CMD_NUMBER_8 = 10,
  CMD_NUMBER_9 = 11,
  CMD_UP = 12,
  CMD_DOWN = 13,
  CMD_LEFT = 14,
  CMD_RIGHT = 15,
  CMD_OK = 20,
  CMD_HOME_MENU = 21,
  CMD_BACK = 23,
  CMD_VOLUME_UP = 24,
  CMD_VOLUME_DOWN = 25,
  CMD_MUTE_TOGGLE = 26,
  CMD_CHANNEL_UP = 27,
  CMD_CHANNEL_DOWN = 28,
  CMD_BLUE = 29,
  CMD_GREEN = 30,
  CMD_RED = 31,
  CMD_YELLOW = 32,
  CMD_PLAY = 33,
  CMD_PAUSE = 34,
  CMD_STOP = 35,
  CMD_FAST_FORWARD = 36,
  CMD_REWIND = 37,
  CMD_SKIP_FORWARD = 38,
  CMD_SKIP_BACKWARD = 39,
  CMD_RECORD = 40,
  CMD_RECORDING_LIST = 41,
  CMD_REPEAT = 42,
  CMD_LIVE_TV = 43,
  CMD_EPG = 44,
  CMD_PROGRAM_INFORMATION = 45,
  CMD_ASPECT_RATIO = 46,
  CMD_EXTERNAL_INPUT = 47,
  CMD_PIP_SECONDARY_VIDEO = 48,
  CMD_SHOW_SUBTITLE = 49,
  CMD_PROGRAM_LIST = 50,
  CMD_TELE_TEXT = 51,
  CMD_MARK = 52,
  CMD_3D_VIDEO = 400,
  CMD_3D_LR = 401,
  CMD_DASH = 402,
  CMD_PREVIOUS_CHANNEL = 403,
  CMD_FAVORITE_CHANNEL = 404,
  CMD_QUICK_MENU = 405,
  CMD_TEXT_OPTION = 406,
  CMD_AUDIO_DESCRIPTION = 407,
  CMD_ENERGY_SAVING = 409,
  CMD_AV_MODE = 410,
  CMD_SIMPLINK = 411,
  CMD_EXIT = 412,
  CMD_RESERVATION_PROGRAM_LIST = 413,
  CMD_PIP_CHANNEL_UP = 414,
  CMD_PIP_CHANNEL_DOWN = 415,
  CMD_SWITCH_VIDEO = 416,
  CMD_APPS = 417
};

// Status categories for data?target=...
/** @brief Current channel (major/minor number, name, source). */
const string QUERY_CUR_CHANNEL = "cur_channel";
/** @brief Every channel the tuner knows about. */
const string QUERY_CHANNEL_LIST = "channel_list";
/** @brief Which UI the TV is currently showing. */
const string QUERY_CONTEXT_UI = "context_ui";
/** @brief Volume level and mute flag. */
const string QUERY_VOLUME_INFO = "volume_info";
/** @brief JPEG capture of the screen, not XML. */
const string QUERY_SCREEN_IMAGE = "screen_image";
const string QUERY_3D = "is_3d";

/** @brief Value of <type> in a <command> body. */
const string HANDLE_KEY_INPUT = "HandleKeyInput";
const string HANDLE_TOUCH_MOVE = "HandleTouchMove";
const string HANDLE_TOUCH_CLICK = "HandleTouchClick";
const string HANDLE_TOUCH_WHEEL = "HandleTouchWheel";
const string HANDLE_CHANNEL_CHANGE = "HandleChannelChange";

const string SCROLL_UP = "up";
const string SCROLL_DOWN = "down";

struct RemoteCommandInfo {
  int code;
  const char* name;
};

/** @brief Every known key code with its lowercase name, ordered by code. */
const vector<RemoteCommandInfo>& allRemoteCommands();

/** @brief Name of a key code, or an empty string if it is not known. */
string remoteCommandName(int code);

/**
 * @brief Looks up a key code by name ("volume_up", "VOLUME-UP" and
 * "volume up" all match).
 */
optional<int> remoteCommandFromName(const string& name);
}  // namespace lgnc

#endif  // __LGNC_REMOTE_COMMANDS__
