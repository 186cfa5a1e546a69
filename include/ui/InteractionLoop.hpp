#pragma once
#include "Spinner.hpp"
#include "confirm/ConfirmationEngine.hpp"
#include "confirm/KeyEvent.hpp"
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <optional>

// Full-screen front end. Cooperative and single-threaded: each
// iteration ticks the engine, lets ftxui process pending input and
// redraws, then sleeps for one frame interval. Rendering never waits on
// a translation or a running command.
class InteractionLoop {
public:
    explicit InteractionLoop(ConfirmationEngine& engine, int frameIntervalMs = 50,
                             bool showReasoning = true);

    // Blocks until the operator quits. Returns the process exit code.
    int run();

    // ftxui event -> engine key, or nullopt for events the engine ignores.
    static std::optional<KeyEvent> translateEvent(const ftxui::Event& event);

    ftxui::Element render();

private:
    ftxui::Element renderHeader() const;
    ftxui::Element renderModal() const;
    ftxui::Element renderStatus();

    ConfirmationEngine& engine_;
    int     frameIntervalMs_;
    bool    showReasoning_;
    Spinner spinner_;
};
