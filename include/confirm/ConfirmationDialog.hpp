#pragma once
#include "ConfirmationSpec.hpp"
#include "KeyEvent.hpp"
#include "safety/RiskLevel.hpp"
#include <string>

// Modal state for one proposed command. Consumes only the keys that
// mean something to the current modality; everything else is ignored.
class ConfirmationDialog {
public:
    enum class Choice {
        Pending,
        AllowOnce,
        AllowAlways,
        Deny,
        Edit
    };

    enum class Button { No, Yes, Always };

    ConfirmationDialog(std::string command, RiskLevel risk, ConfirmationSpec spec)
        : command_(std::move(command)), risk_(risk), spec_(std::move(spec)) {}

    Choice handleKey(const KeyEvent& key);

    Choice choice() const { return choice_; }
    bool resolved() const { return choice_ != Choice::Pending; }

    const std::string&      command() const { return command_; }
    RiskLevel               risk() const { return risk_; }
    const ConfirmationSpec& spec() const { return spec_; }
    bool                    typed() const {
        return spec_.modality == ConfirmationModality::TypedPhrase;
    }

    Button             selected() const { return selected_; }
    const std::string& typedText() const { return typedText_; }
    bool               remember() const { return remember_; }
    bool               mismatch() const { return mismatch_; }

private:
    Choice handleYesNo(const KeyEvent& key);
    Choice handleTyped(const KeyEvent& key);
    Choice resolve(Choice c) { choice_ = c; return c; }

    std::string      command_;
    RiskLevel        risk_;
    ConfirmationSpec spec_;

    Choice      choice_   = Choice::Pending;
    Button      selected_ = Button::No;   // safe default
    std::string typedText_;
    bool        remember_ = false;
    bool        mismatch_ = false;
};

inline const char* dialogChoiceToString(ConfirmationDialog::Choice c) {
    switch (c) {
        case ConfirmationDialog::Choice::Pending:     return "pending";
        case ConfirmationDialog::Choice::AllowOnce:   return "allow-once";
        case ConfirmationDialog::Choice::AllowAlways: return "allow-always";
        case ConfirmationDialog::Choice::Deny:        return "deny";
        case ConfirmationDialog::Choice::Edit:        return "edit";
    }
    return "deny";
}
