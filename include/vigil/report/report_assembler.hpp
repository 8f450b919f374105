#pragma once

#include "vigil/core/error.hpp"
#include "vigil/task/execution_record.hpp"
#include "vigil/task/task_definition.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vigil {

enum class ReportFormat : std::uint8_t { Json, Html, Pdf };

[[nodiscard]] auto report_format_name(ReportFormat f) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_report_format(std::string_view s)
    -> std::optional<ReportFormat>;

struct ReportArtifact {
  std::string path;
  ReportFormat format{ReportFormat::Json};
  std::uintmax_t size{0};
};

class IReportAssembler {
public:
  virtual ~IReportAssembler() = default;

  [[nodiscard]] virtual auto assemble(const TaskDefinition& def,
                                      const ExecutionRecord& rec,
                                      ReportFormat format)
      -> Result<ReportArtifact> = 0;

  // Report payload without writing anything; carries a `findings` array.
  [[nodiscard]] virtual auto render(const TaskDefinition& def,
                                    const ExecutionRecord& rec)
      -> nlohmann::json = 0;
};

// Writes report_<job>_<timestamp>.<ext> under the reports directory.
class FileReportAssembler : public IReportAssembler {
public:
  explicit FileReportAssembler(std::string directory);

  [[nodiscard]] auto assemble(const TaskDefinition& def,
                              const ExecutionRecord& rec, ReportFormat format)
      -> Result<ReportArtifact> override;
  [[nodiscard]] auto render(const TaskDefinition& def,
                            const ExecutionRecord& rec)
      -> nlohmann::json override;

  [[nodiscard]] static auto render_html(const nlohmann::json& report)
      -> std::string;

private:
  std::string directory_;
};

}  // namespace vigil
