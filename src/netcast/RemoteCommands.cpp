#include "RemoteCommands.hpp"

namespace lgnc {
const vector<RemoteCommandInfo>& allRemoteCommands() {
  static const vector<RemoteCommandInfo> commands = {
      {CMD_POWER, "power"},
      {CMD_NUMBER_0, "number_0"},
      {CMD_NUMBER_1, "number_1"},
      {CMD_NUMBER_2, "number_2"},
      {CMD_NUMBER_3, "number_3"},
      {CMD_NUMBER_4, "number_4"},
      {CMD_NUMBER_5, "number_5"},
      {CMD_NUMBER_6, "number_6"},
      {CMD_NUMBER_7, "number_7"},
      {CMD_NUMBER_8, "number_8"},
      {CMD_NUMBER_9, "number_9"},
      {CMD_UP, "up"},
      {CMD_DOWN, "down"},
      {CMD_LEFT, "left"},
      {CMD_RIGHT, "right"},
      {CMD_OK, "ok"},
      {CMD_HOME_MENU, "home_menu"},
      {CMD_BACK, "back"},
      {CMD_VOLUME_UP, "volume_up"},
      {CMD_VOLUME_DOWN, "volume_down"},
      {CMD_MUTE_TOGGLE, "mute_toggle"},
      {CMD_CHANNEL_UP, "channel_up"},
      {CMD_CHANNEL_DOWN, "channel_down"},
      {CMD_BLUE, "blue"},
      {CMD_GREEN, "green"},
      {CMD_RED, "red"},
      {CMD_YELLOW, "yellow"},
      {CMD_PLAY, "play"},
      {CMD_PAUSE, "pause"},
      {CMD_STOP, "stop"},
      {CMD_FAST_FORWARD, "fast_forward"},
      {CMD_REWIND, "rewind"},
      {CMD_SKIP_FORWARD, "skip_forward"},
      {CMD_SKIP_BACKWARD, "skip_backward"},
      {CMD_RECORD, "record"},
      {CMD_RECORDING_LIST, "recording_list"},
      {CMD_REPEAT, "repeat"},
      {CMD_LIVE_TV, "live_tv"},
      {CMD_EPG, "epg"},
      {CMD_PROGRAM_INFORMATION, "program_information"},
      {CMD_ASPECT_RATIO, "aspect_ratio"},
      {CMD_EXTERNAL_INPUT, "external_input"},
      {CMD_PIP_SECONDARY_VIDEO, "pip_secondary_video"},
      {CMD_SHOW_SUBTITLE, "show_subtitle"},
      {CMD_PROGRAM_LIST, "program_list"},
      {CMD_TELE_TEXT, "tele_text"},
      {CMD_MARK, "mark"},
      {CMD_3D_VIDEO, "3d_video"},
      {CMD_3D_LR, "3d_lr"},
      {CMD_DASH, "dash"},
      {CMD_PREVIOUS_CHANNEL, "previous_channel"},
      {CMD_FAVORITE_CHANNEL, "favorite_channel"},
      {CMD_QUICK_MENU, "quick_menu"},
      {CMD_TEXT_OPTION, "text_option"},
      {CMD_AUDIO_DESCRIPTION, "audio_description"},
      {CMD_ENERGY_SAVING, "energy_saving"},
      {CMD_AV_MODE, "av_mode"},
      {CMD_SIMPLINK, "simplink"},
      {CMD_EXIT, "exit"},
      {CMD_RESERVATION_PROGRAM_LIST, "reservation_program_list"},
      {CMD_PIP_CHANNEL_UP, "pip_channel_up"},
      {CMD_PIP_CHANNEL_DOWN, "pip_channel_down"},
      {CMD_SWITCH_VIDEO, "switch_video"},
      {CMD_APPS, "apps"},
  };
  return commands;
}

string remoteCommandName(int code) {
  for (const auto& it : allRemoteCommands()) {
    if (it.code == code) {
      return it.name;
    }
  }
  return "";
}

optional<int> remoteCommandFromName(const string& name) {
  string normalized = toLower(name);
  std::replace(normalized.begin(), normalized.end(), '-', '_');
  std::replace(normalized.begin(), normalized.end(), ' ', '_');
  for (const auto& it : allRemoteCommands()) {
    if (normalized == it.name) {
      return it.code;
    }
  }
  return std::nullopt;
}
}  // namespace lgnc
