/* src/SpwmSystem.cpp */
#include "SpwmSystem.hpp"
#include <climits> // INT_MAX
#include <cmath>   // std::isfinite

namespace Spwm
{

  // 正規化ライン → ui_in
  uint8_t PackLines(const Config& cfg, uint8_t lines)
  {
    uint8_t val = 0;
    if (lines & Line::SCLK) val |= (uint8_t)(1u << cfg.pin_sclk);
    if (lines & Line::SDI)  val |= (uint8_t)(1u << cfg.pin_sdi);
    if (lines & Line::NCS)  val |= (uint8_t)(1u << cfg.pin_ncs);
    return val;
  }

  // ui_in → 正規化ライン
  uint8_t UnpackLines(const Config& cfg, uint8_t ui_in)
  {
    uint8_t lines = 0;
    if (ui_in & (1u << cfg.pin_sclk)) lines |= Line::SCLK;
    if (ui_in & (1u << cfg.pin_sdi))  lines |= Line::SDI;
    if (ui_in & (1u << cfg.pin_ncs))  lines |= Line::NCS;
    return lines;
  }

  bool ValidateConfig(const Config& cfg, std::string* why)
  {
    const char* err = nullptr;
    if (cfg.clk_hz == 0)
      err = "clk_hz must be non-zero";
    else if (cfg.clk_hz > (uint32_t)INT_MAX)
      err = "clk_hz must be <= 2147483647";
    else if (cfg.pwm_prescale == 0)
      err = "prescale must be non-zero";
    else if (cfg.sync_stages < 1 || cfg.sync_stages > SpiFrame::MAX_SYNC_STAGES)
      err = "sync stages must be 1..4";
    else if (cfg.pin_sclk > 7 || cfg.pin_sdi > 7 || cfg.pin_ncs > 7)
      err = "pin positions must be 0..7";
    else if (cfg.pin_sclk == cfg.pin_sdi || cfg.pin_sclk == cfg.pin_ncs ||
             cfg.pin_sdi == cfg.pin_ncs)
      err = "pin positions must be distinct";
    else if (!std::isfinite(cfg.sim_speed) || cfg.sim_speed <= 0.0f)
      err = "speed must be a positive number";
    else if ((double)cfg.clk_hz * cfg.sim_speed / 60.0 > (double)INT_MAX)
      err = "clk_hz * speed is too large";

    if (err && why) *why = err;
    return err == nullptr;
  }

  // 全ブロックをパワーオン状態に
  static void reset_core(System& sys)
  {
    SpiFrame::Reset(sys.spi);
    RegFile::Reset(sys.regs);
    sys.last_commit = SpiFrame::Commit();
    sys.uo_out  = 0;
    sys.uio_out = 0;
  }

  void Init(System& sys)
  {
    reset_core(sys);
    sys.ui_in  = PackLines(sys.cfg, Line::IDLE);
    sys.rst_n  = true;
    sys.ena    = true;
    sys.cycles = 0;
  }

  void UpdateOutputs(System& sys)
  {
    sys.uo_out  = RegFile::PortA(sys.regs);
    sys.uio_out = RegFile::PortB(sys.regs);
  }

  // 1クロック実行
  // 順序: リセット → イネーブル → デコード → レジスタ反映 → PWM → 出力
  void Tick(System& sys)
  {
    sys.cycles++;

    // 同期リセットはイネーブルより優先
    if (!sys.rst_n)
    {
      reset_core(sys);
      return;
    }
    if (!sys.ena) return;

    SpiFrame::Commit c;
    if (SpiFrame::Tick(sys.spi, sys.cfg, sys.ui_in, c))
    {
      sys.last_commit = c;
      RegFile::Apply(sys.regs, c);
    }

    RegFile::Tick(sys.regs, sys.cfg);
    UpdateOutputs(sys);
  }

}
