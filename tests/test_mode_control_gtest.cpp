/**
 * @file test_mode_control_gtest.cpp
 * @brief Google Test suite for the mode controller, driven through the board bindings
 */
#include <gtest/gtest.h>
#include "uvc_mode_control.h"
#include "uvc_board.h"
#include "uvc_config.h"
#include "tests/mocks/mock_api.h"
#include "tests/mocks/mock_logging.h"

#define LID_CLOSED_MV   1000U
#define LID_OPEN_MV     2400U
#define LID_SHORTED_MV  100U
#define TICK_MS         20U

static void count_status(const uvc_status_t* status, void* ctx) {
    (void)status;
    (*static_cast<int*>(ctx))++;
}

// Test fixture: controller bound to the mock board, lid closed and debounced
class ModeControlTest : public ::testing::Test {
protected:
    uvc_mode_controller_t ctl;

    void SetUp() override {
        mock_reset();
        mock_log_reset();
        uvc_reset_config_to_defaults();

        uvc_hw_t hw;
        uvc_board_hw(&hw);
        ASSERT_TRUE(uvc_mode_controller_init(&ctl, &hw));
        close_lid();
    }

    void tick() {
        mock_advance_ms(TICK_MS);
        uvc_mode_controller_tick(&ctl);
    }

    void ticks(int n) {
        for (int i = 0; i < n; ++i) tick();
    }

    void close_lid() {
        mock_set_lid_mv(LID_CLOSED_MV);
        for (int i = 0; i < 10 && ctl.interlock.state != UVC_INTERLOCK_CLOSED; ++i) tick();
        ASSERT_EQ(ctl.interlock.state, UVC_INTERLOCK_CLOSED);
    }

    // Ticks until the debounced interlock reports Open; returns ticks taken
    int open_lid() {
        mock_set_lid_mv(LID_OPEN_MV);
        int n = 0;
        while (ctl.interlock.state != UVC_INTERLOCK_OPEN && n < 10) {
            tick();
            ++n;
        }
        return n;
    }

    uvc_status_t status() {
        uvc_status_t st;
        uvc_mode_controller_get_status(&ctl, &st);
        return st;
    }

    static uvc_profile_t ramp_profile() {
        uvc_profile_t p;
        uvc_profile_init(&p, "ramp");
        uvc_segment_t s = uvc_segment_ramp(0, 80, 5000);
        uvc_profile_add_segment(&p, UVC_NODE_NONE, &s);
        return p;
    }
};

TEST_F(ModeControlTest, BootsIdleWithOutputOff) {
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_IDLE);
    EXPECT_EQ(ctl.mode, UVC_MODE_STANDARD);
    EXPECT_EQ(mock_get_pwm_duty(), 0) << "LED driver must come up dark";
}

TEST_F(ModeControlTest, InitFailsWithIncompletePwmPort) {
    uvc_hw_t hw;
    uvc_board_hw(&hw);
    hw.pwm.read_duty = NULL;

    uvc_mode_controller_t bad;
    EXPECT_FALSE(uvc_mode_controller_init(&bad, &hw));
    EXPECT_EQ(uvc_mode_controller_state(&bad), UVC_SYSTEM_FAULT);
    EXPECT_EQ(bad.fault, UVC_FAULT_PWM_READBACK);
}

TEST_F(ModeControlTest, StartWithoutProfileRejected) {
    uvc_command_result_t r = uvc_mode_controller_start(&ctl, NULL);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.reason, UVC_REJECT_NO_PROFILE);
    EXPECT_TRUE(mock_log_contains("start rejected: no profile"));
}

TEST_F(ModeControlTest, ZeroDurationSegmentRejectedAndStaysIdle) {
    uvc_profile_t p;
    uvc_profile_init(&p, "bad");
    uvc_segment_t ok = uvc_segment_constant(50, 1000);
    uvc_segment_t zero = uvc_segment_constant(50, 0);
    uvc_profile_add_segment(&p, UVC_NODE_NONE, &ok);
    uvc_profile_add_segment(&p, UVC_NODE_NONE, &zero);

    uvc_command_result_t r = uvc_mode_controller_start(&ctl, &p);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.reason, UVC_REJECT_VALIDATION_FAILED);
    EXPECT_EQ(r.validation, UVC_VALID_NON_POSITIVE_DURATION);
    EXPECT_EQ(r.node, 1) << "Offending node should be reported";
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_IDLE);

    tick();
    EXPECT_EQ(mock_get_pwm_duty(), 0);
}

TEST_F(ModeControlTest, StartRejectedWhileLidOpen) {
    open_lid();
    uvc_profile_t p = ramp_profile();
    uvc_command_result_t r = uvc_mode_controller_start(&ctl, &p);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.reason, UVC_REJECT_INTERLOCK_OPEN);
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_IDLE);
}

TEST_F(ModeControlTest, RampDrivesDuty) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_RUNNING);

    tick(); // first tick after start advances by 0
    EXPECT_EQ(status().elapsed_ms, 0u);
    EXPECT_EQ(mock_get_pwm_duty(), 0);

    ticks(2500 / TICK_MS);
    uvc_status_t st = status();
    EXPECT_EQ(st.elapsed_ms, 2500u);
    EXPECT_EQ(st.remaining_ms, 2500u);
    EXPECT_NEAR(st.intensity_pct, 40.0f, 0.01f);
    EXPECT_EQ(mock_get_pwm_duty(), 400) << "40% of a 1000-count period";
}

TEST_F(ModeControlTest, LidOpenCutsOutputAndFreezesRun) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    tick();
    ticks(2500 / TICK_MS);
    ASSERT_GT(mock_get_pwm_duty(), 0);

    int n = open_lid();
    EXPECT_EQ(n, 1) << "Open must be reported on the first tick after the lid opens";
    uvc_status_t st = status();
    EXPECT_EQ(st.interlock_state, UVC_INTERLOCK_OPEN);
    EXPECT_EQ(mock_get_pwm_duty(), 0) << "Duty must be 0 on the tick the interlock opens";
    EXPECT_EQ(st.system_state, UVC_SYSTEM_PAUSED);
    EXPECT_EQ(st.pause_reason, UVC_PAUSE_INTERLOCK_OPEN);

    const uint32_t frozen = st.elapsed_ms;
    for (int i = 0; i < 50; ++i) {
        tick();
        EXPECT_EQ(mock_get_pwm_duty(), 0) << "Output must stay off while the lid is open";
    }
    EXPECT_EQ(status().elapsed_ms, frozen) << "Run time must not advance while the lid is open";

    // Close again: auto-resume continues from the frozen point without a jump
    close_lid();
    st = status();
    EXPECT_EQ(st.system_state, UVC_SYSTEM_RUNNING);
    EXPECT_EQ(st.elapsed_ms, frozen);
    EXPECT_NEAR(st.intensity_pct, 80.0f * frozen / 5000.0f, 0.01f);

    tick();
    EXPECT_EQ(status().elapsed_ms, frozen + TICK_MS);
}

TEST_F(ModeControlTest, LidOpenWithoutAutoResumeNeedsUserResume) {
    uvc_set_interlock_auto_resume(false);
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    ticks(10);

    open_lid();
    close_lid();
    ticks(5);
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_PAUSED);

    uvc_command_result_t r = uvc_mode_controller_resume(&ctl);
    EXPECT_TRUE(r.accepted);
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_RUNNING);
}

TEST_F(ModeControlTest, ResumeRejectedWhileLidOpen) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    ticks(5);
    open_lid();

    uvc_command_result_t r = uvc_mode_controller_resume(&ctl);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.reason, UVC_REJECT_INTERLOCK_OPEN);
}

TEST_F(ModeControlTest, UserPauseHoldsUntilResume) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    tick();
    ticks(50);

    uvc_command_result_t r = uvc_mode_controller_pause(&ctl);
    EXPECT_TRUE(r.accepted);
    EXPECT_EQ(mock_get_pwm_duty(), 0) << "Pause must cut output immediately";
    uvc_status_t st = status();
    EXPECT_EQ(st.pause_reason, UVC_PAUSE_USER);
    const uint32_t frozen = st.elapsed_ms;

    ticks(100);
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_PAUSED) << "User pause never auto-resumes";
    EXPECT_EQ(status().elapsed_ms, frozen);

    ASSERT_TRUE(uvc_mode_controller_resume(&ctl).accepted);
    tick();
    EXPECT_EQ(status().elapsed_ms, frozen) << "First tick after resume advances by 0";
    tick();
    EXPECT_EQ(status().elapsed_ms, frozen + TICK_MS);
}

TEST_F(ModeControlTest, PauseAndResumeRejectedInWrongState) {
    EXPECT_EQ(uvc_mode_controller_pause(&ctl).reason, UVC_REJECT_NOT_RUNNING);
    EXPECT_EQ(uvc_mode_controller_resume(&ctl).reason, UVC_REJECT_NOT_PAUSED);
    EXPECT_EQ(uvc_mode_controller_acknowledge_fault(&ctl).reason, UVC_REJECT_NOT_FAULTED);
}

TEST_F(ModeControlTest, StopAbortsRunAndCutsOutput) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    tick();
    ticks(100);
    ASSERT_GT(mock_get_pwm_duty(), 0);

    uvc_command_result_t r = uvc_mode_controller_stop(&ctl);
    EXPECT_TRUE(r.accepted);
    EXPECT_EQ(mock_get_pwm_duty(), 0) << "Stop must turn the output off before returning";
    uvc_status_t st = status();
    EXPECT_EQ(st.system_state, UVC_SYSTEM_IDLE);
    EXPECT_EQ(st.last_outcome, UVC_OUTCOME_ABORTED);

    EXPECT_EQ(uvc_mode_controller_stop(&ctl).reason, UVC_REJECT_NOT_ACTIVE);
}

TEST_F(ModeControlTest, LoopCompletesAtExactTotal) {
    uvc_profile_t p;
    uvc_profile_init(&p, "loop");
    uint8_t loop = uvc_profile_add_loop(&p, UVC_NODE_NONE, 3);
    uvc_segment_t a = uvc_segment_constant(30, 400);
    uvc_segment_t b = uvc_segment_constant(60, 600);
    uvc_profile_add_segment(&p, loop, &a);
    uvc_profile_add_segment(&p, loop, &b);

    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    tick();
    ticks(3000 / TICK_MS - 1);
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_RUNNING);
    EXPECT_EQ(status().elapsed_ms, 2980u);

    tick();
    uvc_status_t st = status();
    EXPECT_EQ(st.system_state, UVC_SYSTEM_IDLE) << "Run ends on the tick that reaches 3000 ms";
    EXPECT_EQ(st.last_outcome, UVC_OUTCOME_COMPLETE);
    EXPECT_EQ(mock_get_pwm_duty(), 0);
    EXPECT_TRUE(mock_log_contains("profile complete"));
}

TEST_F(ModeControlTest, StandardRunFromTimeUnit) {
    EXPECT_EQ(uvc_mode_controller_load_standard(&ctl, UVC_TIME_UNIT_MIN_SEC, 0, 50).reason,
              UVC_REJECT_INVALID_ARGUMENT);
    EXPECT_EQ(uvc_mode_controller_load_standard(&ctl, UVC_TIME_UNIT_SEC_MS, 500, 101).reason,
              UVC_REJECT_INVALID_ARGUMENT);

    ASSERT_TRUE(uvc_mode_controller_load_standard(&ctl, UVC_TIME_UNIT_MIN_SEC, 2, 50).accepted);
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, NULL).accepted);
    tick();
    EXPECT_EQ(mock_get_pwm_duty(), 500);
    EXPECT_EQ(status().remaining_ms, 2000u);

    ticks(2000 / TICK_MS);
    EXPECT_EQ(status().last_outcome, UVC_OUTCOME_COMPLETE);
    EXPECT_EQ(mock_get_pwm_duty(), 0);
}

TEST_F(ModeControlTest, ManualStopProfileNeedsCustomMode) {
    uvc_profile_t p;
    uvc_profile_init(&p, "manual");
    p.manual_stop = true;
    uint8_t loop = uvc_profile_add_loop(&p, UVC_NODE_NONE, UVC_REPEAT_INFINITE);
    uvc_segment_t pulse = uvc_segment_pulse(100, 100, 100, 2);
    uvc_profile_add_segment(&p, loop, &pulse);

    uvc_command_result_t r = uvc_mode_controller_load_profile(&ctl, &p);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.validation, UVC_VALID_UNBOUNDED_DURATION);

    ASSERT_TRUE(uvc_mode_controller_select_mode(&ctl, UVC_MODE_CUSTOM).accepted);
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    tick();
    ticks(1000);
    uvc_status_t st = status();
    EXPECT_EQ(st.system_state, UVC_SYSTEM_RUNNING) << "Manual-stop run continues until stopped";
    EXPECT_EQ(st.remaining_ms, UVC_DURATION_UNBOUNDED);

    EXPECT_TRUE(uvc_mode_controller_stop(&ctl).accepted);
}

TEST_F(ModeControlTest, ModeChangeRejectedDuringRun) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    EXPECT_EQ(uvc_mode_controller_select_mode(&ctl, UVC_MODE_CUSTOM).reason, UVC_REJECT_BUSY);
    EXPECT_EQ(uvc_mode_controller_load_profile(&ctl, &p).reason, UVC_REJECT_BUSY);
    EXPECT_EQ(uvc_mode_controller_start(&ctl, NULL).reason, UVC_REJECT_BUSY);
}

TEST_F(ModeControlTest, LoadedProfileIsPrivateCopy) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_load_profile(&ctl, &p).accepted);
    p.nodes[0].u.segment.duration_ms = 0; // caller edits after load
    EXPECT_TRUE(uvc_mode_controller_start(&ctl, NULL).accepted);
}

TEST_F(ModeControlTest, LidOpenCutsOutputOnFirstTickWithLongDebounce) {
    uvc_set_debounce_ms(500);
    uvc_profile_t p;
    ASSERT_TRUE(uvc_profile_make_standard(&p, 60000, 100));
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    ticks(5);
    ASSERT_GT(mock_get_pwm_duty(), 0);

    mock_set_lid_mv(LID_OPEN_MV);
    uint32_t emitting_ms = 0;
    for (int i = 0; i < 10; ++i) {
        tick();
        if (mock_get_pwm_duty() > 0) emitting_ms += TICK_MS;
    }
    EXPECT_EQ(emitting_ms, 0u) << "No emission once the lid reads open";
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_PAUSED);
}

TEST_F(ModeControlTest, RejectedAcknowledgeStaysInFault) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    ticks(10);
    mock_set_pwm_stuck(true, 700);
    tick();
    ASSERT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_FAULT);

    int pushes = 0;
    uvc_mode_controller_set_status_sink(&ctl, count_status, &pushes);
    mock_log_reset();
    uvc_command_result_t r = uvc_mode_controller_acknowledge_fault(&ctl);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.reason, UVC_REJECT_IN_FAULT);
    EXPECT_EQ(pushes, 0) << "No Idle state may be published while the output is stuck";
    EXPECT_FALSE(mock_log_contains("-> IDLE"));
    EXPECT_EQ(status().fault, UVC_FAULT_PWM_READBACK);
}

TEST_F(ModeControlTest, PwmReadbackMismatchFaults) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    tick();
    ticks(10);

    mock_set_pwm_stuck(true, 700);
    tick();
    uvc_status_t st = status();
    EXPECT_EQ(st.system_state, UVC_SYSTEM_FAULT);
    EXPECT_EQ(st.fault, UVC_FAULT_PWM_READBACK);
    EXPECT_EQ(st.last_outcome, UVC_OUTCOME_FAULTED);

    // Cause persists: acknowledgement falls back to Fault
    uvc_command_result_t r = uvc_mode_controller_acknowledge_fault(&ctl);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.reason, UVC_REJECT_IN_FAULT);
    EXPECT_EQ(uvc_mode_controller_start(&ctl, NULL).reason, UVC_REJECT_IN_FAULT);

    mock_set_pwm_stuck(false, 0);
    r = uvc_mode_controller_acknowledge_fault(&ctl);
    EXPECT_TRUE(r.accepted);
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_IDLE);
    EXPECT_EQ(mock_get_pwm_duty(), 0);
}

TEST_F(ModeControlTest, ShortedLidLineLatchesSensorFault) {
    mock_set_lid_mv(LID_SHORTED_MV);
    tick();
    EXPECT_EQ(status().interlock_state, UVC_INTERLOCK_OPEN) << "Faulted line reads Open at once";

    ticks(uvc_get_sensor_fault_window_ms() / TICK_MS);
    uvc_status_t st = status();
    EXPECT_TRUE(st.sensor_fault);
    EXPECT_EQ(st.system_state, UVC_SYSTEM_FAULT);
    EXPECT_EQ(st.fault, UVC_FAULT_LID_SENSOR);

    // Acknowledged while still shorted: back in Fault on the next tick
    EXPECT_TRUE(uvc_mode_controller_acknowledge_fault(&ctl).accepted);
    tick();
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_FAULT);

    mock_set_lid_mv(LID_CLOSED_MV);
    ticks(uvc_get_sensor_fault_window_ms() / TICK_MS + 1);
    EXPECT_FALSE(status().sensor_fault);
    EXPECT_TRUE(uvc_mode_controller_acknowledge_fault(&ctl).accepted);
    close_lid();
    EXPECT_EQ(uvc_mode_controller_state(&ctl), UVC_SYSTEM_IDLE);
}

TEST_F(ModeControlTest, StatusSinkReceivesUpdates) {
    int pushes = 0;
    uvc_mode_controller_set_status_sink(&ctl, count_status, &pushes);
    tick();
    EXPECT_EQ(pushes, 1);

    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    EXPECT_EQ(pushes, 2) << "State change is pushed immediately";
}

TEST_F(ModeControlTest, BeeperPatternsFollowCommands) {
    uvc_profile_t p = ramp_profile();
    ASSERT_TRUE(uvc_mode_controller_start(&ctl, &p).accepted);
    EXPECT_TRUE(uvc_mode_controller_buzzer_on(&ctl));
    mock_advance_ms(120);
    EXPECT_FALSE(uvc_mode_controller_buzzer_on(&ctl));

    EXPECT_TRUE(uvc_mode_controller_pause(&ctl).accepted);
    EXPECT_TRUE(uvc_mode_controller_buzzer_on(&ctl));
}

TEST_F(ModeControlTest, PeriodicStatusLog) {
    mock_log_reset();
    ticks(uvc_get_periodic_log_ms() / TICK_MS);
    EXPECT_TRUE(mock_log_contains("state=IDLE lid=CLOSED"));
}

// Main function for running all tests
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
