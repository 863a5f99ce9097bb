#ifndef WAVMERGE_MERGER_HPP
#define WAVMERGE_MERGER_HPP

#include <vector>

#include "wavmerge/errors.hpp"
#include "wavmerge/types.hpp"

namespace wavmerge {

// ===================================================================================
// 結合パイプライン
// ファイルごとに デコード -> モノラル化 -> (前処理) -> リサンプル を行い、
// 全ファイルを連結 -> (ピーク正規化) -> 16-bit モノラルWAV にエンコードする。
// 1ファイルでも失敗したら何も出力しない。
// ===================================================================================
MergeResult merge(const std::vector<RawAudioFile>& files, const MergeOptions& options = MergeOptions());

} // namespace wavmerge

#endif // WAVMERGE_MERGER_HPP
