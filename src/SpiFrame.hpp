/* src/SpiFrame.hpp - SPIフレームデコーダ
 *
 * ui_in ピン配置 (既定値, Config::pin_* で変更可):
 *   bit 2: nCS  (アクティブLow)
 *   bit 1: SDI  (COPI)
 *   bit 0: SCLK
 *
 * フレーム: 16ビット MSB first
 *   [15]    R/W (1=書き込み)
 *   [14:8]  アドレス
 *   [7:0]   データ
 *
 * 3本の線はシステムクロックで同期化した上で SCLK 立ち上がりでサンプリング。
 * ちょうど16ビット受信した状態で nCS が High に戻ったときだけコミットする。
 */
#pragma once
#include <cstdint>

namespace Spwm
{
  struct Config; // 前方宣言

  namespace SpiFrame
  {
    static constexpr int FRAME_BITS      = 16;
    static constexpr int MAX_SYNC_STAGES = 4;

    enum class Phase
    {
      IDLE,      // nCS High
      RECEIVING, // nCS Low, 16ビット未満
      COMPLETE,  // 16ビット受信済み, nCS 解放待ち
      OVERRUN    // 17ビット目以降を受信, nCS 解放で破棄
    };

    // デコード済みコマンド
    struct Commit
    {
      bool    write   = false; // true=書き込み
      uint8_t address = 0;     // 7bit
      uint8_t data    = 0;
    };

    struct State
    {
      // 同期化FF (正規化済みライン, [0]が入力側)
      uint8_t sync[MAX_SYNC_STAGES] = {0x04, 0x04, 0x04, 0x04};
      uint8_t prev = 0x04; // 前クロックの同期後ライン

      Phase    phase   = Phase::IDLE;
      uint16_t shift   = 0; // 受信シフトレジスタ
      int      bit_cnt = 0;

      // 統計
      uint32_t committed = 0; // コミットしたフレーム数
      uint32_t aborted   = 0; // 16ビット未満で nCS 解放
      uint32_t overrun   = 0; // 16ビット超過
    };

    void Reset(State& spi);

    // 1クロック分のデコード
    // フレームが確定したら out に格納して true を返す
    bool Tick(State& spi, const Config& cfg, uint8_t ui_in, Commit& out);

    // 16ビットワード → コマンド
    Commit Decode(uint16_t word);

    const char* PhaseName(Phase phase);

  } // namespace SpiFrame
} // namespace Spwm
