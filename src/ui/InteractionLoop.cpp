#include "ui/InteractionLoop.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/loop.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <sstream>
#include <thread>

using namespace ftxui;

namespace {

Color environmentColor(EnvironmentClass c) {
    switch (c) {
        case EnvironmentClass::Production:  return Color::Red;
        case EnvironmentClass::Staging:     return Color::Yellow;
        case EnvironmentClass::Development: return Color::Green;
        case EnvironmentClass::Unknown:     return Color::White;
    }
    return Color::White;
}

Color riskColor(RiskLevel r) {
    switch (r) {
        case RiskLevel::Low:    return Color::Green;
        case RiskLevel::Medium: return Color::Yellow;
        case RiskLevel::High:   return Color::Red;
    }
    return Color::Red;
}

Elements splitLines(const std::string& body) {
    Elements lines;
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(text(line));
    return lines;
}

} // namespace

InteractionLoop::InteractionLoop(ConfirmationEngine& engine, int frameIntervalMs,
                                 bool showReasoning)
    : engine_(engine), frameIntervalMs_(frameIntervalMs), showReasoning_(showReasoning) {}

std::optional<KeyEvent> InteractionLoop::translateEvent(const Event& event) {
    using Kind = KeyEvent::Kind;

    // Control characters first: ftxui reports some of them as characters
    const std::string& raw = event.input();
    if (raw == "\x03") return KeyEvent::of(Kind::Interrupt);
    if (raw == "\x05") return KeyEvent::of(Kind::Edit);
    if (raw == "\x04") return KeyEvent::of(Kind::EndOfInput);

    if (event == Event::Return)     return KeyEvent::of(Kind::Enter);
    if (event == Event::Escape)     return KeyEvent::of(Kind::Escape);
    if (event == Event::Backspace)  return KeyEvent::of(Kind::Backspace);
    if (event == Event::Tab)        return KeyEvent::of(Kind::Tab);
    if (event == Event::ArrowLeft)  return KeyEvent::of(Kind::ArrowLeft);
    if (event == Event::ArrowRight) return KeyEvent::of(Kind::ArrowRight);
    if (event == Event::ArrowUp)    return KeyEvent::of(Kind::ArrowUp);
    if (event == Event::ArrowDown)  return KeyEvent::of(Kind::ArrowDown);

    if (event.is_character()) {
        const std::string c = event.character();
        if (!c.empty() && static_cast<unsigned char>(c[0]) >= 0x20)
            return KeyEvent::character(c);
    }
    return std::nullopt;
}

int InteractionLoop::run() {
    auto screen = ScreenInteractive::Fullscreen();
    screen.ForceHandleCtrlC(false);

    auto renderer = Renderer([&] { return render(); });

    auto component = CatchEvent(renderer, [&](Event event) {
        if (event == Event::Custom) return true;
        auto key = translateEvent(event);
        if (!key) return false;
        engine_.handleKey(*key);
        return true;
    });

    spdlog::info("Interactive session started in context {}", engine_.context().name);

    Loop loop(&screen, component);
    while (!loop.HasQuitted()) {
        engine_.tick();
        if (engine_.quitRequested()) screen.Exit();

        auto s = engine_.state();
        if (s == EngineState::Translating || s == EngineState::Executing)
            spinner_.advance();
        else
            spinner_.reset();

        screen.PostEvent(Event::Custom);
        loop.RunOnce();
        std::this_thread::sleep_for(std::chrono::milliseconds(frameIntervalMs_));
    }

    spdlog::info("Interactive session ended");
    return 0;
}

// ── Rendering ────────────────────────────────────────────────────

Element InteractionLoop::renderHeader() const {
    const auto& ctx = engine_.context();
    auto envColor = environmentColor(ctx.environmentClass);

    Elements parts = {
        text(" KubeGuard ") | bold | color(Color::Cyan) | inverted,
        text(" ctx: "),
        text(ctx.name) | bold,
        text("  env: "),
        text(environmentClassToString(ctx.environmentClass)) | bold | color(envColor),
        text("  ns: " + ctx.effectiveNamespace()),
        filler(),
    };
    if (engine_.auditFailures() > 0)
        parts.push_back(text(" audit log degraded ") | color(Color::Red));
    parts.push_back(text("[" + std::string(engineStateToString(engine_.state())) + "] "));

    auto header = hbox(std::move(parts));
    return ctx.isProduction() ? header | borderHeavy | color(Color::Red)
                              : header | borderLight;
}

Element InteractionLoop::renderStatus() {
    Elements rows;

    if (!engine_.banner().empty())
        rows.push_back(paragraph("! " + engine_.banner()) | color(Color::Yellow) | bold);

    auto s = engine_.state();
    if (s == EngineState::Translating || s == EngineState::Executing) {
        auto secs = engine_.activityElapsedMs() / 1000.0;
        std::ostringstream line;
        line.setf(std::ios::fixed);
        line.precision(1);
        line << " " << (s == EngineState::Translating ? "Translating" : "Running")
             << "... " << secs << "s  (Ctrl-C to cancel)";
        rows.push_back(hbox({
            text(spinner_.frame()) | color(Color::Cyan),
            text(line.str()) | dim,
        }));
    }

    if (!engine_.notice().empty())
        rows.push_back(paragraph(engine_.notice()) | color(Color::GrayLight));

    return vbox(std::move(rows));
}

Element InteractionLoop::renderModal() const {
    const auto* dialog   = engine_.dialog();
    const auto* proposal = engine_.proposal();
    if (!dialog || !proposal) return emptyElement();

    Elements rows;
    rows.push_back(hbox({
        text("Risk: "),
        text(riskLevelToString(dialog->risk())) | bold | color(riskColor(dialog->risk())),
        text("   Environment: "),
        text(proposal->context.name) | bold |
            color(environmentColor(proposal->context.environmentClass)),
    }));
    rows.push_back(separator());
    rows.push_back(text("Command:"));
    rows.push_back(paragraph("  " + dialog->command()) | bold);

    if (proposal->originalCommand && proposal->edited())
        rows.push_back(text("  (edited from: " + *proposal->originalCommand + ")") | dim);

    if (proposal->confidence) {
        auto conf = text("Confidence: " + std::to_string(*proposal->confidence) + "%");
        rows.push_back(proposal->lowConfidence ? conf | color(Color::Yellow) | bold : conf);
    }
    if (showReasoning_ && !proposal->rationale.empty())
        rows.push_back(paragraph("Why: " + proposal->rationale) | dim);

    rows.push_back(separator());

    if (dialog->typed()) {
        const auto& expected = dialog->spec().expectedPhrase;
        const auto& typed    = dialog->typedText();
        bool onTrack = expected.compare(0, typed.size(), typed) == 0;

        rows.push_back(text("Type '" + expected + "' to confirm execution:") | bold);
        rows.push_back(hbox({
            text("[ "),
            text(typed) | color(typed.empty() || onTrack ? Color::White : Color::Red),
            text("_") | blink,
            text(" ]"),
        }));
        rows.push_back(text(dialog->remember() ? "[x] always allow this command"
                                               : "[ ] always allow this command (Tab)"));
        rows.push_back(text("[Enter] confirm  [Ctrl-E] edit  [Esc] cancel") | dim);
    } else {
        auto button = [&](const std::string& label, ConfirmationDialog::Button b) {
            auto e = text(" " + label + " ") | border;
            return dialog->selected() == b ? e | inverted : e;
        };
        rows.push_back(hbox({
            filler(),
            button("No", ConfirmationDialog::Button::No),
            text("  "),
            button("Yes", ConfirmationDialog::Button::Yes),
            text("  "),
            button("Always", ConfirmationDialog::Button::Always),
            filler(),
        }));
        rows.push_back(text("[y]es  [n]o  [a]lways  [e]dit  [Esc] cancel") | dim | center);
    }

    auto title = dialog->risk() == RiskLevel::High ? " Destructive command " : " Confirm command ";
    return window(text(title) | bold | color(riskColor(dialog->risk())), vbox(std::move(rows)))
           | size(WIDTH, LESS_THAN, 90) | clear_under | center;
}

Element InteractionLoop::render() {
    auto output = engine_.output().empty()
        ? text("Type a request, e.g. \"show pods\". 'help' lists commands.") | dim
        : vbox(splitLines(engine_.output()));

    std::string prompt = engine_.editing() ? " edit> " : " > ";
    bool inputLocked = engine_.state() == EngineState::ModalActive;

    auto inputBar = hbox({
        text(prompt) | bold | color(Color::Yellow),
        text(engine_.input()),
        inputLocked ? text("") : text("_") | blink,
        filler(),
    }) | borderLight;
    if (inputLocked) inputBar = inputBar | dim;

    auto base = vbox({
        renderHeader(),
        output | focusPositionRelative(0, 1) | yframe | flex | border,
        renderStatus(),
        inputBar,
    });

    if (engine_.state() == EngineState::ModalActive)
        return dbox({base, renderModal()});
    return base;
}
