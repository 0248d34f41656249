#include <gtest/gtest.h>
#include "appstate.h"
#include "uistrings.h"
#include "measureerror.h"

#include <cstring>

// =============================================================================
// AppState
// =============================================================================

TEST(AppStateTest, EmitsOnlyOnChange) {
    AppState state;
    QVector<ProgramState> seen;
    QObject::connect(&state, &AppState::stateChanged, [&](ProgramState s) { seen << s; });

    state.setState(ProgramState::Idle);
    EXPECT_TRUE(seen.isEmpty());

    state.setState(ProgramState::Measuring);
    state.setState(ProgramState::Measuring);
    state.setState(ProgramState::GroupSelecting);

    ASSERT_EQ(seen.size(), 2);
    EXPECT_EQ(seen[0], ProgramState::Measuring);
    EXPECT_EQ(seen[1], ProgramState::GroupSelecting);
    EXPECT_EQ(state.previousState(), ProgramState::Measuring);
}

TEST(AppStateTest, StateKeys) {
    EXPECT_STREQ(AppState::stateKey(ProgramState::Idle), "mode_idle");
    EXPECT_STREQ(AppState::stateKey(ProgramState::Calibrating), "mode_calibrating");
    EXPECT_STREQ(AppState::stateKey(ProgramState::PickingColor), "mode_pick_color");
}

// =============================================================================
// UiStrings / errors
// =============================================================================

class UiStringsTest : public ::testing::Test {
protected:
    void TearDown() override { UiStrings::setLanguage(UiLanguage::Russian); }
};

TEST_F(UiStringsTest, SwitchLanguage) {
    UiStrings::setLanguage(UiLanguage::English);
    EXPECT_EQ(UiStrings::language(), UiLanguage::English);
    EXPECT_EQ(UiStrings::text("menu_file"), QStringLiteral("File"));

    UiStrings::setLanguage(UiLanguage::Russian);
    EXPECT_EQ(UiStrings::text("menu_file"), QStringLiteral("Файл"));
    EXPECT_EQ(UiStrings::text("menu_file", UiLanguage::English), QStringLiteral("File"));
}

TEST_F(UiStringsTest, UnknownKeyFallsBackToKey) {
    EXPECT_EQ(UiStrings::text("no_such_key"), QStringLiteral("no_such_key"));
}

TEST_F(UiStringsTest, EveryStateHasText) {
    for (ProgramState s : {ProgramState::Idle, ProgramState::Calibrating, ProgramState::Measuring,
                           ProgramState::GroupSelecting, ProgramState::PickingColor}) {
        const char* key = AppState::stateKey(s);
        EXPECT_NE(UiStrings::text(key), QString::fromLatin1(key));
    }
}

TEST_F(UiStringsTest, ErrorTexts) {
    UiStrings::setLanguage(UiLanguage::English);
    EXPECT_EQ(errorText(MeasureError::Uncalibrated), QStringLiteral("Please set the scale first"));
    EXPECT_TRUE(errorText(MeasureError::None).isEmpty());
    EXPECT_EQ(errorName(MeasureError::DegenerateDistribution), QStringLiteral("DegenerateDistribution"));

    EXPECT_TRUE(isRecoverable(MeasureError::EmptyGroup));
    EXPECT_TRUE(isRecoverable(MeasureError::FitDidNotConverge));
    EXPECT_FALSE(isRecoverable(MeasureError::InvalidScale));
}
