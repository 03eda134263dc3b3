/* src/main.cpp - SPI-PWM ペリフェラルエミュレータ Sokol アプリ本体 */

#include "sokol_app.h"   // アプリラッパ
#include "sokol_gfx.h"   // グラフィック
#include "sokol_glue.h"  // appとgfxのグルー
#include "sokol_log.h"   // ロギング
#include "sokol_args.h"  // コマンドライン引数
#include "sokol_audio.h" // オーディオ出力

#include "SpwmSystem.hpp"
#include "Stimulus.hpp"
#include "Args.hpp"
#include "Ui.hpp"

#include <cstdio>

// ---------------------------------------------------------------
//  定数
// ---------------------------------------------------------------
static constexpr int   WINDOW_W          = 720;    // 表示サイズ
static constexpr int   WINDOW_H          = 640;
static constexpr int   AUDIO_SAMPLE_RATE = 44100;  // 音声サンプルレート [Hz]
static constexpr int   AUDIO_BUF_SIZE    = 2048;   // 音声バッファサイズ [サンプル]
static constexpr float AUDIO_LEVEL       = 0.2f;   // PWM High 時の振幅
static constexpr int   RESET_TICKS       = 5;      // リセットパルス幅 [クロック]
static constexpr int   SCOPE_PERIODS     = 3;      // スコープに収める PWM 周期数

// ---------------------------------------------------------------
//  グローバル状態
// ---------------------------------------------------------------
static Spwm::System          g_sys;
static Spwm::Stimulus::State g_stim;  // SPIマスタ
static Spwm::Ui::State       g_ui;
static Spwm::Ui::Scope       g_scope;
static sg_pass_action        g_pass_action;  // レンダーパス開始時の動作

static int   g_reset_cnt = 0;  // rst_n を Low に保つ残りクロック
static int64_t g_audio_acc = 0;  // clk_hz 近くまで加算するので64bit
static float g_audio_buf[AUDIO_BUF_SIZE];

// ---------------------------------------------------------------
//  init_cb
// ---------------------------------------------------------------
static void init_cb(void)
{
  // sokol_audio 初期化
  {
    saudio_desc audio_desc = {};
    audio_desc.num_channels = 1;
    audio_desc.sample_rate  = AUDIO_SAMPLE_RATE;
    audio_desc.logger.func  = slog_func;
    saudio_setup(&audio_desc);
  }

  // sokol_gfx 初期化
  sg_desc gfx_desc = {};
  gfx_desc.environment = sglue_environment();
  gfx_desc.logger.func = slog_func;
  sg_setup(&gfx_desc);

  Spwm::Ui::Init(sapp_dpi_scale());

  // エミュレータ初期化 (パワーオンリセット付き)
  Spwm::Init(g_sys);
  g_reset_cnt = RESET_TICKS;

  // スコープ: 数周期が SCOPE_LEN サンプルに収まるよう間引く
  g_scope.decim = (int)(g_sys.cfg.pwm_period_ticks() * SCOPE_PERIODS / Spwm::Ui::SCOPE_LEN);
  if (g_scope.decim < 1) g_scope.decim = 1;

  // パスアクション (黒クリア)
  g_pass_action.colors[0].load_action = SG_LOADACTION_CLEAR;
  g_pass_action.colors[0].clear_value = {0.05f, 0.05f, 0.08f, 1.0f};
}

// ---------------------------------------------------------------
//  UI からの要求を処理
// ---------------------------------------------------------------
static void process_ui_requests(void)
{
  using namespace Spwm;

  if (g_ui.request_reset)
  {
    g_ui.request_reset = false;
    Stimulus::Clear(g_stim);
    g_reset_cnt = RESET_TICKS;
  }
  if (g_ui.request_send)
  {
    g_ui.request_send = false;
    Stimulus::QueueTransaction(g_stim, g_ui.send_write,
                               (uint8_t)g_ui.send_addr, (uint8_t)g_ui.send_data);
  }
  if (g_ui.request_abort)
  {
    g_ui.request_abort = false;
    Stimulus::QueueAbort(g_stim, g_ui.send_write,
                         (uint8_t)g_ui.send_addr, (uint8_t)g_ui.send_data,
                         g_ui.abort_bits);
  }
  // スライダ操作中は送信中のフレームが終わるまで待つ
  if (g_ui.request_duty && !Stimulus::Busy(g_stim))
  {
    g_ui.request_duty = false;
    Stimulus::QueueTransaction(g_stim, true, RegFile::Reg::DUTY, (uint8_t)g_ui.duty);
  }
  g_sys.ena = g_ui.ena;
}

// ---------------------------------------------------------------
//  frame_cb  フレームごとに呼ばれる
// ---------------------------------------------------------------
static void frame_cb(void)
{
  process_ui_requests();

  // エミュレーション実行
  int tpf = g_sys.cfg.ticks_per_frame();  // 1フレームあたり何ティックか
  int audio_count = 0;                    // バッファのインデックス
  int sr  = saudio_sample_rate();         // 音声サンプリングレート
  const uint8_t scope_mask = (uint8_t)(1u << g_ui.scope_bit);
  for (int i = 0; i < tpf; i++)
  {
    // リセットパルス
    g_sys.rst_n = (g_reset_cnt == 0);
    if (g_reset_cnt > 0) g_reset_cnt--;

    // SPIマスタ → ui_in, 1クロック進める
    g_sys.ui_in = Spwm::Stimulus::Next(g_stim, g_sys.cfg);
    Spwm::Tick(g_sys);

    // スコープ
    if (++g_scope.acc >= g_scope.decim)
    {
      g_scope.acc = 0;
      uint8_t port = g_ui.scope_port_b ? g_sys.uio_out : g_sys.uo_out;
      g_scope.samples[g_scope.head] = (port & scope_mask) ? 1.0f : 0.0f;
      g_scope.head = (g_scope.head + 1) % Spwm::Ui::SCOPE_LEN;
    }

    // 音声サンプリング（システムクロックよりも低頻度）
    // clk_hzに対して、sr/clk_hz の頻度で実行
    g_audio_acc += sr;
    if (g_audio_acc >= (int64_t)g_sys.cfg.clk_hz)
    {
      // カウンタをリセットするが端数を保存
      g_audio_acc -= (int64_t)g_sys.cfg.clk_hz;
      if (audio_count < AUDIO_BUF_SIZE)
      {
        bool high = g_ui.audio_on && (g_sys.uo_out & 0x01);
        g_audio_buf[audio_count++] = high ? AUDIO_LEVEL : -AUDIO_LEVEL;
      }
    }
  }
  saudio_push(g_audio_buf, audio_count);

  // UI 描画
  const float dpi = sapp_dpi_scale();
  const float w   = sapp_widthf() / dpi;
  const float h   = sapp_heightf() / dpi;
  Spwm::Ui::NewFrame(sapp_width(), sapp_height(), sapp_frame_duration(), dpi);

  sg_pass pass = {};
  pass.action    = g_pass_action;
  pass.swapchain = sglue_swapchain();
  sg_begin_pass(&pass);
  Spwm::Ui::Render(g_ui, g_sys, g_stim, g_scope, w, h);
  sg_end_pass();
  sg_commit();
}

// ---------------------------------------------------------------
//  event_cb  イベントハンドラ
// ---------------------------------------------------------------
static void event_cb(const sapp_event* ev)
{
  if (Spwm::Ui::HandleEvent(ev)) return;

  switch (ev->type)
  {
    case SAPP_EVENTTYPE_KEY_DOWN:
      if (ev->key_code == SAPP_KEYCODE_ESCAPE) sapp_request_quit();
      break;

    default:
      break;
  }
}

// ---------------------------------------------------------------
//  cleanup_cb 最後に一回呼ばれる
// ---------------------------------------------------------------
static void cleanup_cb(void)
{
  Spwm::Ui::Shutdown();
  sg_shutdown();
  saudio_shutdown();
  sargs_shutdown();
}

// ---------------------------------------------------------------
//  sokol_main  エントリポイント
// ---------------------------------------------------------------
sapp_desc sokol_main(int argc, char* argv[])
{
  // コマンドライン引数パース
  sargs_desc sargs_d = {};
  sargs_d.argc = argc;
  sargs_d.argv = argv;
  sargs_setup(&sargs_d);

  // clk_hz=10000000 prescale=13 speed=1.0 ...
  if (!Spwm::Args::LoadConfig(g_sys.cfg))
  {
    fprintf(stderr, "Error: 設定が不正なため既定値で起動\n");
    g_sys.cfg = Spwm::Config();
  }

  sapp_desc desc = {};
  desc.init_cb      = init_cb;
  desc.frame_cb     = frame_cb;
  desc.event_cb     = event_cb;
  desc.cleanup_cb   = cleanup_cb;
  desc.width        = WINDOW_W;
  desc.height       = WINDOW_H;
  desc.high_dpi     = true;
  desc.window_title = "SPI-PWM Peripheral Emulator";
  desc.logger.func  = slog_func;
  return desc;  // sokol appの記述子を返す
}
