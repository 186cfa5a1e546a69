#include <gtest/gtest.h>
#include "confirm/ConfirmationDialog.hpp"

using Choice = ConfirmationDialog::Choice;
using Kind   = KeyEvent::Kind;

static ConfirmationDialog yesNoDialog() {
    return ConfirmationDialog("kubectl scale deployment api --replicas=5",
                              RiskLevel::Medium,
                              {ConfirmationModality::YesNo, ""});
}

static ConfirmationDialog typedDialog() {
    return ConfirmationDialog("kubectl delete deployment nginx",
                              RiskLevel::High,
                              {ConfirmationModality::TypedPhrase, "nginx"});
}

static void typeText(ConfirmationDialog& d, const std::string& s) {
    for (char c : s) d.handleKey(KeyEvent::character(std::string(1, c)));
}

TEST(YesNoDialogTest, DefaultButtonIsNo) {
    auto d = yesNoDialog();
    EXPECT_EQ(d.selected(), ConfirmationDialog::Button::No);
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Enter)), Choice::Deny);
}

TEST(YesNoDialogTest, ShortcutKeys) {
    {
        auto d = yesNoDialog();
        EXPECT_EQ(d.handleKey(KeyEvent::character("y")), Choice::AllowOnce);
    }
    {
        auto d = yesNoDialog();
        EXPECT_EQ(d.handleKey(KeyEvent::character("N")), Choice::Deny);
    }
    {
        auto d = yesNoDialog();
        EXPECT_EQ(d.handleKey(KeyEvent::character("a")), Choice::AllowAlways);
    }
    {
        auto d = yesNoDialog();
        EXPECT_EQ(d.handleKey(KeyEvent::character("e")), Choice::Edit);
    }
}

TEST(YesNoDialogTest, NavigateThenEnter) {
    auto d = yesNoDialog();
    d.handleKey(KeyEvent::of(Kind::Tab));
    EXPECT_EQ(d.selected(), ConfirmationDialog::Button::Yes);
    d.handleKey(KeyEvent::of(Kind::ArrowRight));
    EXPECT_EQ(d.selected(), ConfirmationDialog::Button::Always);
    d.handleKey(KeyEvent::of(Kind::ArrowLeft));
    EXPECT_EQ(d.selected(), ConfirmationDialog::Button::Yes);
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Enter)), Choice::AllowOnce);
}

TEST(YesNoDialogTest, UnrelatedKeysAreIgnored) {
    auto d = yesNoDialog();
    typeText(d, "qwrt");
    d.handleKey(KeyEvent::of(Kind::Backspace));
    d.handleKey(KeyEvent::of(Kind::ArrowUp));
    EXPECT_EQ(d.choice(), Choice::Pending);
    EXPECT_EQ(d.selected(), ConfirmationDialog::Button::No);
}

TEST(YesNoDialogTest, EscapeAndInterruptDeny) {
    auto d = yesNoDialog();
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Escape)), Choice::Deny);
    auto d2 = yesNoDialog();
    EXPECT_EQ(d2.handleKey(KeyEvent::of(Kind::Interrupt)), Choice::Deny);
}

TEST(YesNoDialogTest, ResolvedDialogIgnoresFurtherKeys) {
    auto d = yesNoDialog();
    d.handleKey(KeyEvent::character("n"));
    EXPECT_EQ(d.handleKey(KeyEvent::character("y")), Choice::Deny);
}

TEST(TypedDialogTest, ExactMatchAllows) {
    auto d = typedDialog();
    typeText(d, "nginx");
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Enter)), Choice::AllowOnce);
    EXPECT_FALSE(d.mismatch());
}

TEST(TypedDialogTest, PartialMatchDenies) {
    auto d = typedDialog();
    typeText(d, "ngin");
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Enter)), Choice::Deny);
    EXPECT_TRUE(d.mismatch());
}

TEST(TypedDialogTest, CaseSensitive) {
    auto d = typedDialog();
    typeText(d, "NGINX");
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Enter)), Choice::Deny);
}

TEST(TypedDialogTest, ShortcutLettersAreJustText) {
    auto d = typedDialog();
    typeText(d, "yan");
    EXPECT_EQ(d.choice(), Choice::Pending);
    EXPECT_EQ(d.typedText(), "yan");
}

TEST(TypedDialogTest, BackspaceCorrectsInput) {
    auto d = typedDialog();
    typeText(d, "nginz");
    d.handleKey(KeyEvent::of(Kind::Backspace));
    typeText(d, "x");
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Enter)), Choice::AllowOnce);
}

TEST(TypedDialogTest, BackspaceRemovesWholeMultiByteCharacter) {
    ConfirmationDialog d("kubectl delete configmap caf\xC3\xA9",
                         RiskLevel::High,
                         {ConfirmationModality::TypedPhrase, "caf\xC3\xA9"});
    d.handleKey(KeyEvent::character("\xC3\xB1"));  // n with tilde
    d.handleKey(KeyEvent::of(Kind::Backspace));
    EXPECT_EQ(d.typedText(), "");

    typeText(d, "caf");
    d.handleKey(KeyEvent::character("\xC3\xA8"));  // wrong accent
    d.handleKey(KeyEvent::of(Kind::Backspace));
    EXPECT_EQ(d.typedText(), "caf");
    d.handleKey(KeyEvent::character("\xC3\xA9"));
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Enter)), Choice::AllowOnce);
}

TEST(TypedDialogTest, RememberToggleGivesAllowAlways) {
    auto d = typedDialog();
    d.handleKey(KeyEvent::of(Kind::Tab));
    EXPECT_TRUE(d.remember());
    typeText(d, "nginx");
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Enter)), Choice::AllowAlways);
}

TEST(TypedDialogTest, RememberIsIgnoredOnMismatch) {
    auto d = typedDialog();
    d.handleKey(KeyEvent::of(Kind::Tab));
    typeText(d, "nope");
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Enter)), Choice::Deny);
}

TEST(TypedDialogTest, CtrlEEdits) {
    auto d = typedDialog();
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Edit)), Choice::Edit);
}

TEST(TypedDialogTest, EscapeDenies) {
    auto d = typedDialog();
    typeText(d, "nginx");
    EXPECT_EQ(d.handleKey(KeyEvent::of(Kind::Escape)), Choice::Deny);
}
