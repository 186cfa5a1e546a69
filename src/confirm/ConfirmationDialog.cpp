#include "confirm/ConfirmationDialog.hpp"
#include "util/Utf8.hpp"

using Kind = KeyEvent::Kind;

ConfirmationDialog::Choice ConfirmationDialog::handleKey(const KeyEvent& key) {
    if (resolved()) return choice_;

    // Cancel is always honoured
    if (key.kind == Kind::Escape || key.kind == Kind::Interrupt ||
        key.kind == Kind::EndOfInput)
        return resolve(Choice::Deny);

    return typed() ? handleTyped(key) : handleYesNo(key);
}

ConfirmationDialog::Choice ConfirmationDialog::handleYesNo(const KeyEvent& key) {
    switch (key.kind) {
        case Kind::Character:
            if (key.isChar('y') || key.isChar('Y')) return resolve(Choice::AllowOnce);
            if (key.isChar('n') || key.isChar('N')) return resolve(Choice::Deny);
            if (key.isChar('a') || key.isChar('A')) return resolve(Choice::AllowAlways);
            if (key.isChar('e') || key.isChar('E')) return resolve(Choice::Edit);
            return choice_;

        case Kind::Edit:
            return resolve(Choice::Edit);

        case Kind::Tab:
        case Kind::ArrowRight:
            selected_ = selected_ == Button::No  ? Button::Yes
                      : selected_ == Button::Yes ? Button::Always
                                                 : Button::No;
            return choice_;

        case Kind::ArrowLeft:
            selected_ = selected_ == Button::No     ? Button::Always
                      : selected_ == Button::Always ? Button::Yes
                                                    : Button::No;
            return choice_;

        case Kind::Enter:
            switch (selected_) {
                case Button::Yes:    return resolve(Choice::AllowOnce);
                case Button::Always: return resolve(Choice::AllowAlways);
                case Button::No:     return resolve(Choice::Deny);
            }
            return resolve(Choice::Deny);

        default:
            return choice_;
    }
}

ConfirmationDialog::Choice ConfirmationDialog::handleTyped(const KeyEvent& key) {
    switch (key.kind) {
        case Kind::Character:
            typedText_ += key.text;
            return choice_;

        case Kind::Backspace:
            popUtf8(typedText_);
            return choice_;

        case Kind::Tab:
            remember_ = !remember_;
            return choice_;

        case Kind::Edit:
            return resolve(Choice::Edit);

        case Kind::Enter:
            // Exact, case-sensitive. A mismatch cancels; no second try.
            if (typedText_ == spec_.expectedPhrase)
                return resolve(remember_ ? Choice::AllowAlways : Choice::AllowOnce);
            mismatch_ = true;
            return resolve(Choice::Deny);

        default:
            return choice_;
    }
}
