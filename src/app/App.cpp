#include "app/App.h"

#include "app/Config.h"
#include "core/PlatformUtils.h"
#include "nav/Controller.h"
#include "size/SizeWorker.h"
#include "state/PersistentState.h"
#include "ui/Dialogs.h"
#include "ui/Screen.h"
#include "ui/StatusBar.h"
#include "ui/TreePanel.h"

#include <cstring>
#include <filesystem>
#include <iostream>

namespace treenav {

App* App::instance_ = nullptr;

static void printUsage() {
    std::cout << "Usage: treenav [PATH]\n"
              << "\n"
              << "Interactive directory navigator. Prints the chosen directory on exit.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help       Show this help\n"
              << "  -V, --version    Show the version\n";
}

App::App() {
    instance_ = this;
}

App::~App() {
    instance_ = nullptr;
}

App& App::instance() {
    return *instance_;
}

bool App::parseArgs(int argc, char* argv[]) {
    bool havePath = false;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            printUsage();
            return false;
        }
        if (std::strcmp(arg, "-V") == 0 || std::strcmp(arg, "--version") == 0) {
            std::cout << "treenav " << TREENAV_VERSION << std::endl;
            return false;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::cerr << "treenav: unknown option: " << arg << std::endl;
            exitCode_ = 1;
            return false;
        }
        if (havePath) {
            std::cerr << "treenav: unexpected argument: " << arg << std::endl;
            exitCode_ = 1;
            return false;
        }
        rootArg_ = arg;
        havePath = true;
    }
    return true;
}

bool App::init(int argc, char* argv[]) {
    if (!parseArgs(argc, argv)) {
        return false;
    }

    // Resolve the root before anything touches the terminal
    std::error_code ec;
    std::filesystem::path root = std::filesystem::canonical(rootArg_, ec);
    if (ec) {
        std::cerr << "treenav: cannot resolve " << rootArg_ << ": " << ec.message() << std::endl;
        exitCode_ = 1;
        return false;
    }
    if (!std::filesystem::is_directory(root, ec)) {
        std::cerr << "treenav: not a directory: " << root.string() << std::endl;
        exitCode_ = 1;
        return false;
    }
    rootPath_ = root.string();

    // Load config
    Config::instance().load();

    statePath_ = PersistentState::getStatePath();
    state_ = std::make_unique<PersistentState>(PersistentState::load(statePath_));

    if (!Screen::instance().init(Config::instance().theme)) {
        exitCode_ = 1;
        return false;
    }

    sizeWorker_ = std::make_unique<SizeWorker>();
    controller_ = std::make_unique<Controller>(rootPath_, *state_, *sizeWorker_);

    // Sizes for directories left expanded by the previous session
    for (const auto& dir : state_->expandedDirs) {
        if (PlatformUtils::isWithin(dir, rootPath_) && dir != rootPath_) {
            controller_->requestSize(dir);
        }
    }
    return true;
}

void App::run() {
    Screen& screen = Screen::instance();
    while (!controller_->shouldQuit()) {
        // Drain size results
        controller_->tick();

        draw();

        TermEvent ev;
        if (screen.poll(ev)) {
            processEvent(ev);
        }
    }
}

void App::shutdown() {
    Screen::instance().shutdown();

    if (state_) {
        state_->save(statePath_);
    }

    if (controller_ && controller_->chosenDir()) {
        std::cout << *controller_->chosenDir() << std::endl;
    }

    controller_.reset();
    sizeWorker_.reset();
}

void App::processEvent(const TermEvent& ev) {
    switch (ev.kind) {
        case TERM_KEY:
            controller_->handleKey(ev.key);
            break;
        case TERM_MOUSE: {
            MouseEvent mouse;
            mouse.action = ev.mouseAction;
            mouse.row = TreePanel::instance().rowAt(ev.y, ev.x);
            mouse.time = PlatformUtils::getTime();
            controller_->handleMouse(mouse);
            break;
        }
        case TERM_RESIZE:
        case TERM_NONE:
            // Next draw picks up the new size
            break;
    }
}

void App::draw() {
    Screen& screen = Screen::instance();
    screen.beginFrame();

    TreePanel::instance().draw(*controller_);
    StatusBar::instance().draw(*controller_);
    Dialogs::instance().draw(*controller_);

    screen.present();
}

} // namespace treenav
