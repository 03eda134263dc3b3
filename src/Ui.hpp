/* src/Ui.hpp - メニューバー / パネル / ステータスバー UI */
#pragma once

#include "SpwmSystem.hpp"
#include "Stimulus.hpp"

struct sapp_event; // sokol_app.h

namespace Spwm
{
namespace Ui
{

  static constexpr int SCOPE_LEN = 512; // スコープ表示サンプル数

  struct State
  {
    // リクエスト (main が次フレームで処理してクリアする)
    bool request_reset = false;
    bool request_send  = false;
    bool request_abort = false;
    bool request_duty  = false;

    // コマンドパネル
    bool send_write = true;
    int  send_addr  = 0x00;
    int  send_data  = 0x00;
    int  abort_bits = 8;
    int  duty       = 0;   // DUTY スライダ

    // ピン・表示
    bool ena          = true;
    bool audio_on     = true;  // ポートA bit0 を音声出力
    bool scope_port_b = false;
    int  scope_bit    = 0;

    float menu_h   = 20.0f;  // メニューバー実高さ
    float status_h = 20.0f;  // ステータスバー実高さ
  };

  // スコープ用リングバッファ
  struct Scope
  {
    float samples[SCOPE_LEN] = {};
    int   head = 0;   // 次に書き込む位置
    int   decim = 1;  // 何クロックごとに1サンプル取るか
    int   acc = 0;
  };

  void Init(float dpi);
  bool HandleEvent(const sapp_event* ev);
  void NewFrame(int w, int h, double delta_time, float dpi);
  void Render(State& ui, const System& sys, const Stimulus::State& stim,
              const Scope& scope, float win_w, float win_h);
  void Shutdown();

} // namespace Ui
} // namespace Spwm
