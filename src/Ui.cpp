/* src/Ui.cpp - メニューバー / パネル / ステータスバー UI 実装 */

// sokol_imgui.h は sokol_gfx.h → sokol_app.h → imgui.h の順でインクルード必須
#include "sokol_gfx.h"
#include "sokol_app.h"
#include "sokol_log.h"
#include "imgui.h"
#include "sokol_imgui.h"

#include "Ui.hpp"
#include <cstdio>

namespace Spwm
{
namespace Ui
{

static float   s_dpi       = 1.0f;
static ImFont* s_mono_font = nullptr; // ステータスバー用等幅フォント (ProggyClean)

// LED 色
static const ImU32 kLedOn   = IM_COL32(255,  60,  40, 255);
static const ImU32 kLedOff  = IM_COL32( 70,  20,  20, 255);
static const ImU32 kPwmRing = IM_COL32( 80, 200, 255, 255);

// ------------------------------------------------------------------
//  Init  sokol_gfx 初期化後に一度だけ呼ぶ
// ------------------------------------------------------------------
void Init(float dpi)
{
  s_dpi = dpi;

  simgui_desc_t desc = {};
  desc.no_default_font = true;
  desc.logger.func     = slog_func;
  simgui_setup(&desc);

  ImGuiIO& io = ImGui::GetIO();
  ImFontConfig cfg = {};
  cfg.SizePixels = 13.0f * dpi;
  s_mono_font = io.Fonts->AddFontDefault(&cfg);
}

bool HandleEvent(const sapp_event* ev)
{
  return simgui_handle_event(ev);
}

// ------------------------------------------------------------------
//  NewFrame  毎フレーム描画前に呼ぶ（simgui_new_frame ラッパ）
// ------------------------------------------------------------------
void NewFrame(int w, int h, double delta_time, float dpi)
{
  s_dpi = dpi;
  simgui_frame_desc_t fd = {};
  fd.width      = w;
  fd.height     = h;
  fd.delta_time = delta_time;
  fd.dpi_scale  = dpi;
  simgui_new_frame(&fd);
}

// ------------------------------------------------------------------
//  LED 列 (bit7 → bit0)
//  PWM 有効ビットは外周リングで示す
// ------------------------------------------------------------------
static void led_row(const char* label, uint8_t value, uint8_t pwm_mask)
{
  ImGui::Text("%s %02X", label, value);
  ImGui::SameLine();

  const float r   = 7.0f * s_dpi;
  const float gap = 6.0f * s_dpi;
  ImDrawList* dl  = ImGui::GetWindowDrawList();
  ImVec2 p        = ImGui::GetCursorScreenPos();
  float  cy       = p.y + ImGui::GetTextLineHeight() * 0.5f;

  for (int i = 0; i < 8; i++)
  {
    int bit = 7 - i;
    ImVec2 c(p.x + r + i * (2 * r + gap), cy);
    dl->AddCircleFilled(c, r, (value >> bit) & 1 ? kLedOn : kLedOff);
    if ((pwm_mask >> bit) & 1) dl->AddCircle(c, r + 2.0f * s_dpi, kPwmRing);
  }
  ImGui::Dummy(ImVec2(8 * (2 * r + gap), 2 * r));
}

// ------------------------------------------------------------------
//  ポート / レジスタ パネル
// ------------------------------------------------------------------
static void ports_panel(const System& sys)
{
  const RegFile::State& r = sys.regs;

  led_row("uo_out  (A)", sys.uo_out,  r.pwm_en_a);
  led_row("uio_out (B)", sys.uio_out, r.pwm_en_b);

  ImGui::Separator();

  if (ImGui::BeginTable("regs", 3, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg))
  {
    ImGui::TableSetupColumn("Addr");
    ImGui::TableSetupColumn("Name");
    ImGui::TableSetupColumn("Value");
    ImGui::TableHeadersRow();
    for (uint8_t a = 0; a < RegFile::Reg::COUNT; a++)
    {
      ImGui::TableNextRow();
      ImGui::TableNextColumn(); ImGui::Text("0x%02X", a);
      ImGui::TableNextColumn(); ImGui::TextUnformatted(RegFile::RegName(a));
      ImGui::TableNextColumn(); ImGui::Text("0x%02X", RegFile::Peek(r, a));
    }
    ImGui::EndTable();
  }

  double duty = (r.duty == RegFile::DUTY_FULL) ? 100.0
              : 100.0 * r.duty / RegFile::PWM_STEPS;
  ImGui::Text("PWM  %.1f Hz  duty %.2f %%  counter %3u",
              sys.cfg.pwm_hz(), duty, r.counter);

  ImGui::Separator();
  ImGui::Text("Decoder  %-9s bits %2d", SpiFrame::PhaseName(sys.spi.phase), sys.spi.bit_cnt);
  ImGui::Text("Frames   committed %u  aborted %u  overrun %u  ignored %u",
              sys.spi.committed, sys.spi.aborted, sys.spi.overrun, r.ignored);

  const SpiFrame::Commit& c = sys.last_commit;
  if (sys.spi.committed > 0)
    ImGui::Text("Last     %c addr=0x%02X data=0x%02X", c.write ? 'W' : 'R', c.address, c.data);
}

// ------------------------------------------------------------------
//  コマンドパネル (SPI マスタ)
// ------------------------------------------------------------------
static void command_panel(State& ui, const Stimulus::State& stim)
{
  ImGui::Checkbox("Write", &ui.send_write);
  ImGui::InputInt("Address", &ui.send_addr, 1, 16, ImGuiInputTextFlags_CharsHexadecimal);
  ImGui::InputInt("Data",    &ui.send_data, 1, 16, ImGuiInputTextFlags_CharsHexadecimal);
  if (ui.send_addr < 0)    ui.send_addr = 0;
  if (ui.send_addr > 0x7F) ui.send_addr = 0x7F;
  if (ui.send_data < 0)    ui.send_data = 0;
  if (ui.send_data > 0xFF) ui.send_data = 0xFF;

  if (ImGui::Button("Send")) ui.request_send = true;
  ImGui::SameLine();
  ImGui::SetNextItemWidth(80.0f * s_dpi);
  ImGui::SliderInt("bits", &ui.abort_bits, 0, SpiFrame::FRAME_BITS - 1);
  ImGui::SameLine();
  if (ImGui::Button("Send short frame")) ui.request_abort = true;

  ImGui::Separator();
  if (ImGui::SliderInt("DUTY", &ui.duty, 0, 255)) ui.request_duty = true;

  ImGui::Separator();
  ImGui::Checkbox("ena", &ui.ena);
  ImGui::SameLine();
  if (ImGui::Button("Reset")) ui.request_reset = true;
  ImGui::SameLine();
  ImGui::Checkbox("Audio (A0)", &ui.audio_on);

  if (Stimulus::Busy(stim))
    ImGui::Text("SPI busy: %u ticks queued", Stimulus::PendingTicks(stim));
  else
    ImGui::TextDisabled("SPI idle");
}

// ------------------------------------------------------------------
//  スコープ
// ------------------------------------------------------------------
static void scope_panel(State& ui, const Scope& scope)
{
  if (ImGui::RadioButton("A", !ui.scope_port_b)) ui.scope_port_b = false;
  ImGui::SameLine();
  if (ImGui::RadioButton("B", ui.scope_port_b))  ui.scope_port_b = true;
  ImGui::SameLine();
  ImGui::SetNextItemWidth(100.0f * s_dpi);
  ImGui::SliderInt("bit", &ui.scope_bit, 0, 7);

  char overlay[32];
  snprintf(overlay, sizeof(overlay), "%d ticks/sample", scope.decim);
  ImGui::PlotLines("##scope", scope.samples, SCOPE_LEN, scope.head, overlay,
                   -0.1f, 1.1f, ImVec2(-1.0f, 80.0f * s_dpi));
}

// ------------------------------------------------------------------
//  Render  ImGui ウィジェット構築 + simgui_render
// ------------------------------------------------------------------
void Render(State& ui, const System& sys, const Stimulus::State& stim,
            const Scope& scope, float win_w, float win_h)
{
  // ---- メニューバー ----
  if (ImGui::BeginMainMenuBar())
  {
    ui.menu_h = ImGui::GetWindowHeight();

    if (ImGui::BeginMenu("System"))
    {
      if (ImGui::MenuItem("Reset")) ui.request_reset = true;
      ImGui::MenuItem("Enable", nullptr, &ui.ena);
      ImGui::EndMenu();
    }

    ImGui::EndMainMenuBar();
  }

  // ---- 本体 (メニューとステータスバーの間) ----
  {
    float top = ui.menu_h;
    float h   = win_h - ui.menu_h - ui.status_h;
    ImGui::SetNextWindowPos(ImVec2(0, top));
    ImGui::SetNextWindowSize(ImVec2(win_w, h));

    static constexpr ImGuiWindowFlags kMainFlags =
      ImGuiWindowFlags_NoDecoration   |
      ImGuiWindowFlags_NoMove         |
      ImGuiWindowFlags_NoBringToFrontOnFocus |
      ImGuiWindowFlags_NoSavedSettings;

    if (ImGui::Begin("##main", nullptr, kMainFlags))
    {
      if (ImGui::CollapsingHeader("Ports", ImGuiTreeNodeFlags_DefaultOpen))
        ports_panel(sys);
      if (ImGui::CollapsingHeader("SPI master", ImGuiTreeNodeFlags_DefaultOpen))
        command_panel(ui, stim);
      if (ImGui::CollapsingHeader("Scope", ImGuiTreeNodeFlags_DefaultOpen))
        scope_panel(ui, scope);
    }
    ImGui::End();
  }

  // ---- ステータスバー: 時刻・ピン状態・実効速度 ----
  {
    float sh = ImGui::GetFrameHeightWithSpacing();
    ui.status_h = sh;

    ImGui::SetNextWindowPos(ImVec2(0, win_h - sh));
    ImGui::SetNextWindowSize(ImVec2(win_w, sh));
    if (ImGui::Begin("##status", nullptr,
                     ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                     ImGuiWindowFlags_NoSavedSettings))
    {
      ImGui::PushFont(s_mono_font);

      // シミュレーション時刻 [ms]
      double t_ms = 1000.0 * (double)sys.cycles / (double)sys.cfg.clk_hz;
      ImGui::Text("t=%10.3f ms", t_ms);
      ImGui::SameLine();

      const char* pin = !sys.rst_n ? "rst_n:0" : (!sys.ena ? "ena:0" : "run");
      ImGui::TextColored(sys.rst_n && sys.ena ? ImVec4(0.3f, 1.0f, 0.3f, 1.0f)
                                              : ImVec4(1.0f, 0.6f, 0.2f, 1.0f), "%s", pin);
      ImGui::SameLine();

      // 実効速度 = FPS * ticks/frame
      float fps = ImGui::GetIO().Framerate;
      ImGui::Text("x%.2f real time", fps * sys.cfg.ticks_per_frame() / (double)sys.cfg.clk_hz);

      ImGui::PopFont();
    }
    ImGui::End();
  }

  // ---- GPU レンダリング ----
  simgui_render();
}

// ------------------------------------------------------------------
//  Shutdown
// ------------------------------------------------------------------
void Shutdown()
{
  simgui_shutdown();
}

} // namespace Ui
} // namespace Spwm
