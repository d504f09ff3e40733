/**
 * @file main.cpp
 * @brief Точка входа BallTrack
 *
 * Разбирает командную строку, закрепляет за игроком идентификатор (новый
 * профиль или продолжение существующего), настраивает журнал и запускает
 * контроллер с выбранным интерфейсом.
 */

#include <getopt.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "ball_tracker/bt_config.h"
#include "ball_tracker/bt_tracker.h"
#include "ball_tracker/common/bt_common.h"
#include "ball_tracker/ledger/bt_profile_store.hpp"
#include "controller/bt_controller.hpp"
#include "gui/cli/cli.h"

#ifdef BT_WITH_QT
#include <QApplication>

#include "gui/desktop/qt_view.hpp"
#endif

namespace {

struct Options {
  bool has_user = false;
  unsigned user_id = 0;
  bool resume = false;
  std::string interface = "cli";
  std::string data_dir;
  bool verbose = false;
};

void printUsage(const char* prog) {
  std::printf(
      "Usage: %s [options]\n"
      "  -u, --user ID          numeric player ID\n"
      "  -r, --resume           continue an existing profile\n"
      "  -i, --interface NAME   cli (default) or desktop\n"
      "  -d, --data-dir DIR     profile directory (default ~/%s)\n"
      "  -v, --verbose          debug logging\n"
      "  -h, --help             show this help\n",
      prog, BT_DATA_DIR_NAME);
}

// 0 - продолжить, 1 - ошибка, 2 - справка выведена
int parseOptions(int argc, char** argv, Options* opts) {
  static const struct option long_opts[] = {
      {"user", required_argument, nullptr, 'u'},
      {"resume", no_argument, nullptr, 'r'},
      {"interface", required_argument, nullptr, 'i'},
      {"data-dir", required_argument, nullptr, 'd'},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  int c;
  while ((c = getopt_long(argc, argv, "u:ri:d:vh", long_opts, nullptr)) != -1) {
    switch (c) {
      case 'u':
        if (!bt::parseUserId(optarg, &opts->user_id)) {
          std::fprintf(stderr, "Invalid user ID: %s\n", optarg);
          return 1;
        }
        opts->has_user = true;
        break;
      case 'r':
        opts->resume = true;
        break;
      case 'i':
        opts->interface = optarg;
        if (opts->interface != "cli" && opts->interface != "desktop") {
          std::fprintf(stderr, "Unknown interface: %s\n", optarg);
          return 1;
        }
        break;
      case 'd':
        opts->data_dir = optarg;
        break;
      case 'v':
        opts->verbose = true;
        break;
      case 'h':
        printUsage(argv[0]);
        return 2;
      default:
        printUsage(argv[0]);
        return 1;
    }
  }
  if (optind < argc) {
    std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
    return 1;
  }
  return 0;
}

/**
 * @brief Закрепить идентификатор за игроком.
 *
 * Новый игрок занимает свободный ID (профиль с рекордом 0 и пустой
 * историей). С --resume существующий профиль загружается как есть.
 */
bool acquireIdentity(bt::FileProfileStore& store, unsigned user_id,
                     bool resume) {
  if (store.exists(user_id)) {
    if (resume) {
      spdlog::info("resuming profile {}", user_id);
      return true;
    }
    std::printf("ID \"%u\" is already taken.\n", user_id);
    return false;
  }

  if (resume) {
    spdlog::warn("no profile {} to resume, creating a new one", user_id);
  }
  if (!store.claim(user_id)) {
    std::printf("Could not register ID \"%u\".\n", user_id);
    return false;
  }
  spdlog::info("profile {} created", user_id);
  return true;
}

bool promptIdentity(bt::FileProfileStore& store, bool resume,
                    unsigned* user_id) {
  std::string line;
  for (;;) {
    std::printf("Enter your numeric ID: ");
    std::fflush(stdout);
    if (!std::getline(std::cin, line)) return false;

    if (!bt::parseUserId(line, user_id)) {
      std::printf("Please enter a valid numeric ID.\n");
      continue;
    }
    if (acquireIdentity(store, *user_id, resume)) return true;
  }
}

}  // namespace

int main(int argc, char** argv) {
  Options opts;
  int parsed = parseOptions(argc, argv, &opts);
  if (parsed != 0) return parsed == 2 ? EXIT_SUCCESS : EXIT_FAILURE;

  spdlog::set_pattern("[%H:%M:%S] %l %v");
  spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);

  if (opts.data_dir.empty()) {
    char buf[1024];
    if (!bt_default_data_dir(buf, sizeof(buf))) {
      spdlog::error("data directory path is too long");
      return EXIT_FAILURE;
    }
    opts.data_dir = buf;
  }
  if (!bt_ensure_dir(opts.data_dir.c_str())) {
    spdlog::error("cannot create data directory {}: {}", opts.data_dir,
                  std::strerror(errno));
    return EXIT_FAILURE;
  }

  bt::FileProfileStore store(opts.data_dir);
  unsigned user_id = opts.user_id;
  if (opts.has_user) {
    if (!acquireIdentity(store, user_id, opts.resume)) return EXIT_FAILURE;
  } else if (!promptIdentity(store, opts.resume, &user_id)) {
    return EXIT_FAILURE;
  }

  const ViewInterface* view = &cli_view;
#ifdef BT_WITH_QT
  int qt_argc = 1;
  std::unique_ptr<QApplication> app;
  if (opts.interface == "desktop") {
    app = std::make_unique<QApplication>(qt_argc, argv);
    view = &qt_view;
  }
#else
  if (opts.interface == "desktop") {
    spdlog::error("desktop interface is not available in this build");
    return EXIT_FAILURE;
  }
#endif

  // ncurses занимает терминал: журнал уходит в файл
  std::shared_ptr<spdlog::logger> console = spdlog::default_logger();
  if (view == &cli_view) {
    const std::string log_path = opts.data_dir + "/" + BT_LOG_FILE_NAME;
    try {
      spdlog::set_default_logger(
          spdlog::basic_logger_mt("balltrack", log_path));
    } catch (const spdlog::spdlog_ex& e) {
      spdlog::warn("cannot open log file {}: {}", log_path, e.what());
    }
  }

  int rc = EXIT_FAILURE;
  void* game = tracker_create(user_id, opts.data_dir.c_str());
  if (game != nullptr) {
    bt::Controller controller(*view, game);
    if (controller.open()) {
      rc = controller.run();
    }
  }
  tracker_destroy(game);

  spdlog::set_default_logger(console);
  spdlog::drop("balltrack");
  if (game == nullptr) {
    spdlog::error("cannot start the game");
  }
  return rc;
}
