// Test cases for the complete peripheral (pins, reset, enable, PWM timing)

#include <catch2/catch.hpp>
#include <limits>
#include <string>

#include "TestBench.hpp"

using namespace Spwm;
using namespace TestBench;

TEST_CASE("system_static_outputs") {
    System sys;
    Stimulus::State stim;
    PowerOn(sys, stim);

    CHECK(sys.uo_out == 0);
    CHECK(sys.uio_out == 0);
    CHECK(sys.uio_oe == 0xFF);

    SECTION("port-a") {
        for (unsigned v : {0x00u, 0x01u, 0x5Au, 0xA5u, 0xF0u, 0xFFu}) {
            Send(sys, stim, true, RegFile::Reg::OUT_A, (uint8_t)v);
            CHECK(sys.uo_out == v);
            CHECK(sys.uio_out == 0);
        }
    }

    SECTION("port-b") {
        for (unsigned v : {0x00u, 0x80u, 0xCCu, 0x33u, 0xFFu}) {
            Send(sys, stim, true, RegFile::Reg::OUT_B, (uint8_t)v);
            CHECK(sys.uio_out == v);
            CHECK(sys.uo_out == 0);
        }
        CHECK(sys.uio_oe == 0xFF);
    }

    SECTION("invalid-commands") {
        Send(sys, stim, true, RegFile::Reg::OUT_A, 0xF0);
        Send(sys, stim, true, RegFile::Reg::OUT_B, 0xCC);
        Send(sys, stim, true, 0x30, 0xAA);
        Send(sys, stim, false, 0x30, 0xBE);
        Send(sys, stim, false, 0x41, 0xEF);
        Send(sys, stim, false, RegFile::Reg::OUT_A, 0x00);
        CHECK(sys.uo_out == 0xF0);
        CHECK(sys.uio_out == 0xCC);
        CHECK(sys.spi.committed == 6);
        CHECK(sys.regs.ignored == 4);
        CHECK_FALSE(sys.last_commit.write);
        CHECK(sys.last_commit.address == 0x00);
    }
}

TEST_CASE("system_write_timing") {
    System sys;
    Stimulus::State stim;
    PowerOn(sys, stim);

    // コミットしたクロックの終わりには出力に反映済み
    Stimulus::QueueTransaction(stim, true, RegFile::Reg::OUT_A, 0x3C);
    uint32_t before = sys.spi.committed;
    int ticks = 0;
    while (sys.spi.committed == before) {
        REQUIRE(Stimulus::Busy(stim));
        Step(sys, stim);
        if (sys.spi.committed == before) CHECK(sys.uo_out == 0);
        ticks++;
    }
    CHECK(sys.uo_out == 0x3C);
    // nCS Low 1 + 16ビット + 同期化2段
    CHECK(ticks == 1 + 2 * 16 * (int)stim.half_period + 2);
}

TEST_CASE("system_abort_has_no_effect") {
    System sys;
    Stimulus::State stim;
    PowerOn(sys, stim);
    Send(sys, stim, true, RegFile::Reg::OUT_A, 0x11);

    for (int bits = 0; bits < 16; bits++) {
        REQUIRE(Stimulus::QueueAbort(stim, true, RegFile::Reg::OUT_A, 0xEE, bits));
        Drain(sys, stim);
        CHECK(sys.uo_out == 0x11);
    }
    CHECK(sys.spi.aborted == 16);
    CHECK(sys.spi.committed == 1);
}

TEST_CASE("system_reset") {
    System sys;
    Stimulus::State stim;
    PowerOn(sys, stim);
    Send(sys, stim, true, RegFile::Reg::OUT_A, 0xF0);
    Send(sys, stim, true, RegFile::Reg::OUT_B, 0xCC);
    Send(sys, stim, true, RegFile::Reg::PWM_EN_A, 0x0F);
    Send(sys, stim, true, RegFile::Reg::DUTY, 0x80);
    Run(sys, stim, 1000);

    SECTION("clears-registers") {
        sys.rst_n = false;
        Step(sys, stim);
        CHECK(sys.uo_out == 0);
        CHECK(sys.uio_out == 0);
        for (uint8_t a = 0; a < RegFile::Reg::COUNT; a++)
            CHECK(RegFile::Peek(sys.regs, a) == 0);
        CHECK(sys.regs.counter == 0);
        CHECK(sys.spi.committed == 0);

        sys.rst_n = true;
        Run(sys, stim, 5000);
        CHECK(sys.uo_out == 0);
        CHECK(sys.uio_out == 0);
    }

    SECTION("dominates-enable") {
        sys.ena   = false;
        sys.rst_n = false;
        Step(sys, stim);
        CHECK(sys.uo_out == 0);
        CHECK(sys.regs.out_b == 0);
    }

    SECTION("frame-in-reset-is-lost") {
        sys.rst_n = false;
        Stimulus::QueueTransaction(stim, true, RegFile::Reg::OUT_B, 0x55);
        Drain(sys, stim);
        sys.rst_n = true;
        Run(sys, stim, 10);
        CHECK(sys.uio_out == 0);
        CHECK(sys.spi.committed == 0);
    }
}

TEST_CASE("system_enable") {
    System sys;
    Stimulus::State stim;
    PowerOn(sys, stim);
    Send(sys, stim, true, RegFile::Reg::OUT_A, 0x81);
    Send(sys, stim, true, RegFile::Reg::PWM_EN_B, 0x01);
    Send(sys, stim, true, RegFile::Reg::DUTY, 0x80);

    sys.ena = false;
    const uint8_t  counter = sys.regs.counter;
    const uint8_t  out_b   = sys.uio_out;

    // 停止中は PWM も止まり、フレームも受け付けない
    Send(sys, stim, true, RegFile::Reg::OUT_A, 0x00);
    Run(sys, stim, 5000);
    CHECK(sys.regs.counter == counter);
    CHECK(sys.uio_out == out_b);
    CHECK(sys.uo_out == 0x81);
    CHECK(sys.regs.out_a == 0x81);

    sys.ena = true;
    Run(sys, stim, 100);
    CHECK(sys.regs.counter != counter);
    Send(sys, stim, true, RegFile::Reg::OUT_A, 0x42);
    CHECK(sys.uo_out == 0x42);
}

TEST_CASE("system_pwm_timing") {
    System sys;
    Stimulus::State stim;
    PowerOn(sys, stim);

    SECTION("frequency-and-duty") {
        Send(sys, stim, true, RegFile::Reg::PWM_EN_A, 0xFF);
        for (unsigned d : {0x01u, 0x40u, 0x80u, 0xCFu, 0xFEu}) {
            Send(sys, stim, true, RegFile::Reg::DUTY, (uint8_t)d);
            Probe::State p = Measure(sys, stim, false, 0);
            REQUIRE(Probe::Done(p));
            double hz = Probe::FrequencyHz(p, sys.cfg.clk_hz);
            CHECK(hz >= 2970.0);
            CHECK(hz <= 3030.0);
            CHECK(Probe::DutyPercent(p) == Approx(100.0 * d / 255.0).epsilon(0.01));
        }
    }

    SECTION("all-enabled-bits-in-phase") {
        Send(sys, stim, true, RegFile::Reg::OUT_A, 0x0F);
        Send(sys, stim, true, RegFile::Reg::PWM_EN_A, 0xF0);
        Send(sys, stim, true, RegFile::Reg::DUTY, 0x80);
        for (uint32_t i = 0; i < sys.cfg.pwm_period_ticks(); i++) {
            Step(sys, stim);
            const uint8_t hi = sys.uo_out & 0xF0;
            CHECK((hi == 0x00 || hi == 0xF0));
            CHECK((sys.uo_out & 0x0F) == 0x0F);
        }
    }

    SECTION("port-b") {
        Send(sys, stim, true, RegFile::Reg::PWM_EN_B, 0x80);
        Send(sys, stim, true, RegFile::Reg::DUTY, 0x40);
        Probe::State p = Measure(sys, stim, true, 7);
        REQUIRE(Probe::Done(p));
        CHECK(Probe::FrequencyHz(p, sys.cfg.clk_hz) == Approx(3000.0).epsilon(0.01));
        CHECK(Probe::DutyPercent(p) == Approx(100.0 * 0x40 / 255.0).epsilon(0.01));
        CHECK(sys.uo_out == 0);
    }

    SECTION("constant-levels") {
        Send(sys, stim, true, RegFile::Reg::PWM_EN_A, 0x01);
        Send(sys, stim, true, RegFile::Reg::DUTY, 0xFF);
        Probe::State p = Measure(sys, stim, false, 0);
        CHECK_FALSE(Probe::Done(p));
        CHECK(p.rises == 0);
        CHECK(p.falls == 0);
        CHECK(p.level);

        Send(sys, stim, true, RegFile::Reg::DUTY, 0x00);
        p = Measure(sys, stim, false, 0);
        CHECK_FALSE(Probe::Done(p));
        CHECK(p.rises == 0);
        CHECK_FALSE(p.level);
    }
}

TEST_CASE("system_pwm_disable_restores_static") {
    System sys;
    Stimulus::State stim;
    PowerOn(sys, stim);

    SECTION("port-a") {
        Send(sys, stim, true, RegFile::Reg::OUT_A, 0xA5);
        Send(sys, stim, true, RegFile::Reg::PWM_EN_A, 0xFF);
        Send(sys, stim, true, RegFile::Reg::DUTY, 0x00);
        CHECK(sys.uo_out == 0x00);
        Send(sys, stim, true, RegFile::Reg::PWM_EN_A, 0x00);
        CHECK(sys.uo_out == 0xA5);
    }

    SECTION("port-b") {
        Send(sys, stim, true, RegFile::Reg::OUT_B, 0xA5);
        Send(sys, stim, true, RegFile::Reg::PWM_EN_B, 0xFF);
        Send(sys, stim, true, RegFile::Reg::DUTY, 0x00);
        CHECK(sys.uio_out == 0x00);
        Send(sys, stim, true, RegFile::Reg::PWM_EN_B, 0x00);
        CHECK(sys.uio_out == 0xA5);
    }
}

TEST_CASE("system_prescale_config") {
    System sys;
    Stimulus::State stim;
    sys.cfg.pwm_prescale = 4;
    PowerOn(sys, stim);
    Send(sys, stim, true, RegFile::Reg::PWM_EN_A, 0x01);
    Send(sys, stim, true, RegFile::Reg::DUTY, 0x80);

    Probe::State p = Measure(sys, stim, false, 0);
    REQUIRE(Probe::Done(p));
    CHECK(Probe::PeriodTicks(p) == 4 * 256);
    CHECK(Probe::HighTicks(p) == 4 * 0x80);
}

TEST_CASE("system_config_validation") {
    Config cfg;
    std::string why;
    CHECK(ValidateConfig(cfg, &why));

    SECTION("zero-clock") {
        cfg.clk_hz = 0;
        CHECK_FALSE(ValidateConfig(cfg, &why));
        CHECK_FALSE(why.empty());
    }
    SECTION("clock-range") {
        cfg.clk_hz = 0x7FFFFFFFu;
        CHECK(ValidateConfig(cfg));
        cfg.clk_hz = 0x80000000u;
        CHECK_FALSE(ValidateConfig(cfg));
        cfg.clk_hz = 0xFFFFFFFFu;
        CHECK_FALSE(ValidateConfig(cfg));
    }
    SECTION("zero-prescale") {
        cfg.pwm_prescale = 0;
        CHECK_FALSE(ValidateConfig(cfg));
    }
    SECTION("sync-stages") {
        cfg.sync_stages = 0;
        CHECK_FALSE(ValidateConfig(cfg));
        cfg.sync_stages = 5;
        CHECK_FALSE(ValidateConfig(cfg));
        cfg.sync_stages = 4;
        CHECK(ValidateConfig(cfg));
    }
    SECTION("pins") {
        cfg.pin_ncs = 8;
        CHECK_FALSE(ValidateConfig(cfg));
        cfg.pin_ncs = 1;
        CHECK_FALSE(ValidateConfig(cfg, &why));
        CHECK(why == "pin positions must be distinct");
        cfg.pin_ncs = 7;
        CHECK(ValidateConfig(cfg));
    }
    SECTION("speed") {
        cfg.sim_speed = 0.0f;
        CHECK_FALSE(ValidateConfig(cfg));
        cfg.sim_speed = std::numeric_limits<float>::quiet_NaN();
        CHECK_FALSE(ValidateConfig(cfg));
        cfg.sim_speed = std::numeric_limits<float>::infinity();
        CHECK_FALSE(ValidateConfig(cfg));
        cfg.sim_speed = 1.0e9f;
        CHECK_FALSE(ValidateConfig(cfg));
        cfg.sim_speed = 4.0f;
        CHECK(ValidateConfig(cfg));
    }
}
