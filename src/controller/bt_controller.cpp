/**
 * @file bt_controller.cpp
 * @brief Реализация цикла кадров BallTrack
 */

#include "bt_controller.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <limits>
#include <thread>

#include <spdlog/spdlog.h>

#include "../ball_tracker/common/bt_common.h"

namespace bt {

namespace {

struct ZoneLayout {
  const char* name;
  int x, y, w, h;
};

// Разметка в ячейках экрана 80×29
constexpr ZoneLayout kZones[] = {
    {"title", 1, 0, 60, 1},    {"level", 1, 1, 18, 1},
    {"best", 20, 1, 18, 1},    {"arena", 1, 3, 37, 23},
    {"status", 40, 3, 38, 3},  {"button", 40, 7, 38, 1},
    {"notice", 40, 9, 38, 2},  {"history", 40, 12, 38, 14},
    {"help", 1, 27, 78, 1},
};

constexpr int kHistoryZoneHeight = 14;

constexpr const char* kHelp =
    "Enter/S start  Space lost track  Click pick  E export  Q quit";

}  // namespace

Command commandForKey(int key_code) noexcept {
  switch (key_code) {
    case VIEW_KEY_ENTER:
    case '\r':
    case 's':
    case 'S':
      return Command::START;
    case VIEW_KEY_SPACE:
      return Command::LOSE_TRACK;
    case 'e':
    case 'E':
      return Command::EXPORT;
    case 'q':
    case 'Q':
    case VIEW_KEY_ESCAPE:
      return Command::QUIT;
    default:
      return Command::NONE;
  }
}

bool parseUserId(const std::string& text, unsigned* out) noexcept {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;
  if (begin == end) return false;

  unsigned long long value = 0;
  for (std::size_t i = begin; i < end; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    value = value * 10 + static_cast<unsigned>(text[i] - '0');
    if (value > std::numeric_limits<unsigned>::max()) return false;
  }
  if (out != nullptr) *out = static_cast<unsigned>(value);
  return true;
}

std::string formatAttempt(const AttemptView_t& attempt) {
  char buf[BT_TEXT_MAX];
  if (attempt.completed) {
    std::snprintf(buf, sizeof(buf), "Level %d: Answered in %.1fs",
                  attempt.level, attempt.seconds);
  } else {
    std::snprintf(buf, sizeof(buf), "Level %d: Gave up at %.1fs",
                  attempt.level, attempt.seconds);
  }
  return buf;
}

std::string formatHistory(const TrackerInfo_t& info, std::size_t max_lines) {
  std::string out;
  if (info.history == nullptr) return out;

  std::size_t lines = 0;
  for (int i = info.history_count - 1; i >= 0 && lines < max_lines; --i) {
    if (!out.empty()) out += '\n';
    out += formatAttempt(info.history[i]);
    ++lines;
  }
  return out;
}

Controller::Controller(const ViewInterface& view, void* game, int fps)
    : view_(view), game_(game), fps_(fps > 0 ? fps : BT_FRAME_RATE) {}

Controller::~Controller() noexcept {
  if (handle_ != nullptr) {
    view_.shutdown(handle_);
  }
}

bool Controller::open(int width, int height) {
  if (view_.version != VIEW_INTERFACE_VERSION) {
    spdlog::error("view interface version {}, expected {}", view_.version,
                  VIEW_INTERFACE_VERSION);
    return false;
  }

  handle_ = view_.init(width, height, fps_);
  if (handle_ == nullptr) {
    spdlog::error("view initialization failed");
    return false;
  }

  for (const auto& zone : kZones) {
    ViewResult_t r =
        view_.configure_zone(handle_, zone.name, zone.x, zone.y, zone.w, zone.h);
    if (r != VIEW_OK) {
      spdlog::error("cannot configure zone '{}' ({})", zone.name,
                    static_cast<int>(r));
      return false;
    }
  }
  return true;
}

int Controller::run() {
  if (handle_ == nullptr || game_ == nullptr) return 1;

  using clock = std::chrono::steady_clock;
  const auto frame = std::chrono::microseconds(1000000 / fps_);
  auto next = clock::now();

  while (step()) {
    next += frame;
    auto now = clock::now();
    if (next > now) {
      std::this_thread::sleep_until(next);
    } else {
      next = now;  // отстали: не догоняем пропущенные кадры
    }
  }
  return 0;
}

bool Controller::step() {
  if (handle_ == nullptr || game_ == nullptr) return false;

  InputEvent_t event{};
  while (!quit_ && view_.poll_input(handle_, &event) == VIEW_OK) {
    dispatch_(event);
  }
  if (quit_) return false;

  tracker_update(game_);

  const TrackerInfo_t* info = tracker_get_info(game_);
  if (info == nullptr) {
    spdlog::error("game snapshot unavailable");
    return false;
  }
  if (!bt_is_valid_info(info)) {
    spdlog::warn("inconsistent game snapshot in phase {}",
                 static_cast<int>(info->phase));
  }

  draw_(*info);
  view_.render(handle_);
  return true;
}

void Controller::dispatch_(const InputEvent_t& event) {
  if (event.kind == INPUT_TAP) {
    tracker_tap(game_, event.x, event.y);
    return;
  }

  switch (commandForKey(event.key_code)) {
    case Command::START: {
      const TrackerInfo_t* info = tracker_get_info(game_);
      if (info != nullptr && info->start_enabled) {
        notice_.clear();
        tracker_handle_input(game_, Start, false);
      }
      break;
    }
    case Command::LOSE_TRACK:
      tracker_handle_input(game_, LoseTrack, false);
      break;
    case Command::EXPORT:
      exportHistory_();
      break;
    case Command::QUIT:
      tracker_handle_input(game_, Terminate, false);
      quit_ = true;
      break;
    case Command::NONE:
    default:
      break;
  }
}

void Controller::exportHistory_() {
  char path[1024] = {0};
  switch (tracker_export(game_, path, sizeof(path))) {
    case EXPORT_OK:
      notice_ = std::string("CSV file created: ") + path;
      break;
    case EXPORT_EMPTY:
      notice_ = "No history to export.";
      break;
    case EXPORT_FAILED:
    default:
      notice_ = "Export failed. See the log for details.";
      break;
  }
}

void Controller::draw_(const TrackerInfo_t& info) {
  char buf[BT_TEXT_MAX];

  std::snprintf(buf, sizeof(buf), "BALL TRACKER    player %u", info.user_id);
  drawText_("title", buf);

  std::snprintf(buf, sizeof(buf), "Level: %d", info.level);
  drawText_("level", buf);

  std::snprintf(buf, sizeof(buf), "Best: %d", info.personal_best);
  drawText_("best", buf);

  drawText_("status", info.message != nullptr ? info.message : "");

  if (info.start_enabled && info.start_label != nullptr) {
    drawText_("button", std::string("[ Enter: ") + info.start_label + " ]");
  } else {
    drawText_("button", "");
  }

  drawText_("notice", notice_);

  std::string history = formatHistory(info, kHistoryZoneHeight - 1);
  drawText_("history",
            "History\n" + (history.empty() ? "No attempts yet." : history));

  drawText_("help", kHelp);

  ElementData_t arena{};
  arena.type = ELEMENT_BALLS;
  arena.content.balls.data = info.balls;
  arena.content.balls.count = info.ball_count;
  arena.content.balls.arena_width = info.arena_width;
  arena.content.balls.arena_height = info.arena_height;
  ViewResult_t r = view_.draw_element(handle_, "arena", &arena);
  if (r != VIEW_OK) {
    spdlog::debug("arena draw failed ({})", static_cast<int>(r));
  }
}

void Controller::drawText_(const char* zone, const std::string& text) {
  ElementData_t data{};
  data.type = ELEMENT_TEXT;
  data.content.text = text.c_str();
  ViewResult_t r = view_.draw_element(handle_, zone, &data);
  if (r != VIEW_OK) {
    spdlog::debug("zone '{}' draw failed ({})", zone, static_cast<int>(r));
  }
}

}  // namespace bt
