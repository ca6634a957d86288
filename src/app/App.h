#pragma once

#include <memory>
#include <string>

namespace treenav {

class Controller;
class PersistentState;
class SizeWorker;
struct TermEvent;

class App {
public:
    App();
    ~App();

    // Parse arguments, load state and enter curses mode. Returns false when
    // the process should exit; exitCode() tells with which status.
    bool init(int argc, char* argv[]);
    void run();
    void shutdown();

    int exitCode() const { return exitCode_; }

    static App& instance();

private:
    // Returns false if the arguments ask for an early exit.
    bool parseArgs(int argc, char* argv[]);
    void processEvent(const TermEvent& ev);
    void draw();

    std::string rootArg_ = ".";
    std::string rootPath_;
    std::string statePath_;
    int exitCode_ = 0;

    std::unique_ptr<PersistentState> state_;
    std::unique_ptr<SizeWorker> sizeWorker_;
    std::unique_ptr<Controller> controller_;

    static App* instance_;
};

} // namespace treenav
