// Test cases for the register file and PWM generator

#include <catch2/catch.hpp>
#include <string>

#include "RegFile.hpp"
#include "SpwmSystem.hpp"

using namespace Spwm;

namespace
{
  SpiFrame::Commit wr(uint8_t addr, uint8_t data)
  {
    SpiFrame::Commit c;
    c.write   = true;
    c.address = addr;
    c.data    = data;
    return c;
  }

  SpiFrame::Commit rd(uint8_t addr, uint8_t data)
  {
    SpiFrame::Commit c = wr(addr, data);
    c.write = false;
    return c;
  }

  // 1周期分 High だったクロック数
  uint32_t high_ticks(RegFile::State& regs, const Config& cfg)
  {
    uint32_t high = 0;
    for (uint32_t i = 0; i < cfg.pwm_period_ticks(); i++)
    {
      RegFile::Tick(regs, cfg);
      if (RegFile::PortA(regs) & 0x01) high++;
    }
    return high;
  }
}

TEST_CASE("regfile_address_map") {
    for (unsigned a = 0; a < 5; a++)
        CHECK(RegFile::IsWritableAddress((uint8_t)a));
    for (unsigned a = 5; a < 128; a++)
        CHECK_FALSE(RegFile::IsWritableAddress((uint8_t)a));
    CHECK(std::string(RegFile::RegName(RegFile::Reg::DUTY)) == "DUTY");
    CHECK(std::string(RegFile::RegName(0x30)) == "-");
}

TEST_CASE("regfile_apply") {
    RegFile::State regs;

    SECTION("writes") {
        RegFile::Apply(regs, wr(RegFile::Reg::OUT_A, 0xF0));
        RegFile::Apply(regs, wr(RegFile::Reg::OUT_B, 0xCC));
        RegFile::Apply(regs, wr(RegFile::Reg::PWM_EN_A, 0x0F));
        RegFile::Apply(regs, wr(RegFile::Reg::PWM_EN_B, 0x81));
        RegFile::Apply(regs, wr(RegFile::Reg::DUTY, 0x80));
        CHECK(regs.out_a == 0xF0);
        CHECK(regs.out_b == 0xCC);
        CHECK(regs.pwm_en_a == 0x0F);
        CHECK(regs.pwm_en_b == 0x81);
        CHECK(regs.duty == 0x80);
        CHECK(regs.ignored == 0);
        for (uint8_t a = 0; a < RegFile::Reg::COUNT; a++)
            CHECK(RegFile::Peek(regs, a) != 0);
    }

    SECTION("read-is-ignored") {
        RegFile::Apply(regs, wr(RegFile::Reg::OUT_A, 0x55));
        RegFile::Apply(regs, rd(RegFile::Reg::OUT_A, 0xAA));
        CHECK(regs.out_a == 0x55);
        CHECK(regs.ignored == 1);
    }

    SECTION("unmapped-is-ignored") {
        for (unsigned a = 5; a < 128; a++)
            RegFile::Apply(regs, wr((uint8_t)a, 0xFF));
        CHECK(regs.out_a == 0);
        CHECK(regs.out_b == 0);
        CHECK(regs.pwm_en_a == 0);
        CHECK(regs.pwm_en_b == 0);
        CHECK(regs.duty == 0);
        CHECK(regs.ignored == 123);
    }

    SECTION("reset") {
        RegFile::Apply(regs, wr(RegFile::Reg::DUTY, 0x40));
        RegFile::Apply(regs, rd(0x10, 0));
        regs.counter = 77;
        RegFile::Reset(regs);
        CHECK(regs.duty == 0);
        CHECK(regs.counter == 0);
        CHECK(regs.prescale_cnt == 0);
        CHECK(regs.ignored == 0);
    }
}

TEST_CASE("regfile_mux") {
    RegFile::State regs;
    RegFile::Apply(regs, wr(RegFile::Reg::OUT_A, 0xF0));
    RegFile::Apply(regs, wr(RegFile::Reg::OUT_B, 0xCC));

    // PWM 無効なら静的値そのまま
    CHECK(RegFile::PortA(regs) == 0xF0);
    CHECK(RegFile::PortB(regs) == 0xCC);

    // DUTY=0: 有効ビットは常に Low
    RegFile::Apply(regs, wr(RegFile::Reg::PWM_EN_A, 0x3C));
    RegFile::Apply(regs, wr(RegFile::Reg::PWM_EN_B, 0x0F));
    CHECK(RegFile::PortA(regs) == 0xC0);
    CHECK(RegFile::PortB(regs) == 0xC0);

    // DUTY=255: 有効ビットは常に High
    RegFile::Apply(regs, wr(RegFile::Reg::DUTY, 0xFF));
    CHECK(RegFile::PortA(regs) == 0xFC);
    CHECK(RegFile::PortB(regs) == 0xCF);
}

TEST_CASE("regfile_pwm_disable_restores_static") {
    RegFile::State regs;

    SECTION("port-a") {
        RegFile::Apply(regs, wr(RegFile::Reg::OUT_A, 0xA5));
        RegFile::Apply(regs, wr(RegFile::Reg::PWM_EN_A, 0xFF));
        RegFile::Apply(regs, wr(RegFile::Reg::DUTY, 0x00));
        CHECK(RegFile::PortA(regs) == 0x00);
        CHECK(regs.out_a == 0xA5);  // PWM 中も OUT_A は保持

        RegFile::Apply(regs, wr(RegFile::Reg::PWM_EN_A, 0x00));
        CHECK(RegFile::PortA(regs) == 0xA5);
    }

    SECTION("port-b") {
        RegFile::Apply(regs, wr(RegFile::Reg::OUT_B, 0x5A));
        RegFile::Apply(regs, wr(RegFile::Reg::PWM_EN_B, 0xFF));
        RegFile::Apply(regs, wr(RegFile::Reg::DUTY, 0xFF));
        CHECK(RegFile::PortB(regs) == 0xFF);
        CHECK(regs.out_b == 0x5A);

        RegFile::Apply(regs, wr(RegFile::Reg::PWM_EN_B, 0x00));
        CHECK(RegFile::PortB(regs) == 0x5A);
    }
}

TEST_CASE("regfile_pwm_counter") {
    Config cfg;
    RegFile::State regs;

    CHECK(cfg.pwm_period_ticks() == 3328);
    CHECK(cfg.pwm_hz() == Approx(3000.0).epsilon(0.01));

    // prescale クロックで1ステップ
    for (int i = 0; i < cfg.pwm_prescale - 1; i++) RegFile::Tick(regs, cfg);
    CHECK(regs.counter == 0);
    RegFile::Tick(regs, cfg);
    CHECK(regs.counter == 1);

    // 1周で元に戻る
    for (uint32_t i = 0; i < cfg.pwm_period_ticks() - cfg.pwm_prescale; i++)
        RegFile::Tick(regs, cfg);
    CHECK(regs.counter == 0);
    CHECK(regs.prescale_cnt == 0);
}

TEST_CASE("regfile_pwm_duty_sweep") {
    Config cfg;
    RegFile::State regs;
    RegFile::Apply(regs, wr(RegFile::Reg::PWM_EN_A, 0x01));

    SECTION("fraction") {
        for (int d = 1; d < 255; d++) {
            RegFile::Apply(regs, wr(RegFile::Reg::DUTY, (uint8_t)d));
            double frac = (double)high_ticks(regs, cfg) / cfg.pwm_period_ticks();
            CHECK(frac == Approx(d / 255.0).epsilon(0.01));
        }
    }

    SECTION("extremes") {
        RegFile::Apply(regs, wr(RegFile::Reg::DUTY, 0));
        CHECK(high_ticks(regs, cfg) == 0);
        RegFile::Apply(regs, wr(RegFile::Reg::DUTY, 0xFF));
        CHECK(high_ticks(regs, cfg) == cfg.pwm_period_ticks());
    }
}
