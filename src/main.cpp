#include "app/App.h"

int main(int argc, char* argv[]) {
    treenav::App app;

    if (!app.init(argc, argv)) {
        return app.exitCode();
    }

    app.run();
    app.shutdown();

    return 0;
}
