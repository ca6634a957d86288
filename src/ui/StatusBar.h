#pragma once

namespace treenav {

class Controller;

// Bottom line: key hints, or the search input while searching.
class StatusBar {
public:
    static StatusBar& instance();
    void draw(const Controller& controller);

private:
    StatusBar() = default;

    void drawHints(const Controller& controller, int y);
    void drawSearch(const Controller& controller, int y);
};

} // namespace treenav
