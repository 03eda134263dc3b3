/* src/SpwmSystem.hpp - SPI-PWM ペリフェラル全体 (ピン・設定・内部状態) */
#pragma once

#include <cstdint> // 固定長整数
#include <string>  // エラーメッセージ

#include "SpiFrame.hpp"
#include "RegFile.hpp"

namespace Spwm
{

  // ui_in 内の3本のシリアル線を正規化したビット
  // (実際の ui_in 上の位置は Config::pin_* で決まる)
  namespace Line
  {
    constexpr uint8_t SCLK = 0x01;
    constexpr uint8_t SDI  = 0x02;
    constexpr uint8_t NCS  = 0x04; // アクティブLow
    constexpr uint8_t IDLE = NCS;  // バス解放状態
  }

  // 動作設定
  struct Config
  {
    uint32_t clk_hz       = 10000000; // システムクロック [Hz] (リファレンスは10MHz)
    uint16_t pwm_prescale = 13;       // PWMカウンタ1ステップあたりのクロック数
    int      sync_stages  = 2;        // 入力同期化FF段数
    float    sim_speed    = 1.0f;     // GUI 用シミュレーション速度倍率

    // ui_in 上のピン位置 (リファレンスは {nCS, SDI, SCLK} = bit2..0)
    uint8_t pin_sclk = 0;
    uint8_t pin_sdi  = 1;
    uint8_t pin_ncs  = 2;

    // PWM 1周期のクロック数
    uint32_t pwm_period_ticks() const
    {
      return (uint32_t)pwm_prescale * RegFile::PWM_STEPS;
    }

    // PWM 周波数 [Hz]
    double pwm_hz() const
    {
      return (double)clk_hz / (double)pwm_period_ticks();
    }

    // 60fps で1フレームあたりに進めるティック数
    int ticks_per_frame() const
    {
      return (int)((double)clk_hz * sim_speed / 60.0);
    }
  };

  // システム全体
  struct System
  {
    Config cfg;

    // 内部ブロック
    SpiFrame::State spi;
    RegFile::State  regs;

    // 入力ピン
    uint8_t ui_in = Line::IDLE; // Init で設定に合わせて再パック
    bool    rst_n = true;       // 同期リセット (Low有効)
    bool    ena   = true;       // Low の間は状態を一切進めない

    // 出力ピン
    uint8_t uo_out  = 0; // ポートA
    uint8_t uio_out = 0; // ポートB
    uint8_t uio_oe  = 0xFF; // 双方向ピンはすべて出力

    // 最後にコミットされたフレーム (spi.committed が進んだら更新される)
    SpiFrame::Commit last_commit;

    // 経過クロック数 (シミュレーション時刻, リセットでは戻らない)
    uint64_t cycles = 0;
  };

  // ピン配置変換
  uint8_t PackLines(const Config& cfg, uint8_t lines);
  uint8_t UnpackLines(const Config& cfg, uint8_t ui_in);

  // 設定の検査 (不正なら false, why に理由)
  bool ValidateConfig(const Config& cfg, std::string* why = nullptr);

  // システム初期化 (パワーオン状態)
  void Init(System& sys);

  // 1クロック実行
  void Tick(System& sys);

  // 出力ポート値を再計算
  void UpdateOutputs(System& sys);

}
