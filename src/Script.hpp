/* src/Script.hpp - テキストスクリプトによるテストベンチ
 *
 *   reset  <ticks>                     rst_n を ticks (>=1) クロック Low
 *   write  <addr> <data>               書き込みフレーム
 *   read   <addr> <data>               読み出しフレーム
 *   abort  <addr> <data> <bits>        bits ビットで打ち切る書き込みフレーム
 *   wait   <ticks>                     アイドル
 *   enable <0|1>                       ena 制御
 *   expect <A|B> <value>               ポート出力の検査
 *   measure <A|B> <bit> <hz> <duty%>   1周期を計測して許容差内か検査
 *
 * 数値は10進または 0x 付き16進。'#' 以降はコメント。
 */
#pragma once
#include <string>

#include "SpwmSystem.hpp"

namespace Spwm
{
namespace Script
{

  struct Options
  {
    bool   trace     = false; // コミットごとに表示
    double tolerance = 0.01;  // measure の相対許容差 (±1%)
  };

  struct Result
  {
    int lines  = 0; // 実行したコマンド行数
    int checks = 0; // expect/measure の回数
    int failed = 0;
  };

  bool RunText(System& sys, const std::string& text, const std::string& name,
               const Options& opt, Result* res = nullptr);
  bool RunFile(System& sys, const std::string& path,
               const Options& opt, Result* res = nullptr);

  // 組み込みのリファレンスシナリオ
  const char* ReferenceScript();

} // namespace Script
} // namespace Spwm
