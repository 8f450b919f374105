#pragma once

#include "vigil/task/execution_record.hpp"

#include <optional>
#include <string_view>

namespace vigil {

class IVerificationGenerator {
public:
  virtual ~IVerificationGenerator() = default;

  // nullopt leaves the finding unverified
  [[nodiscard]] virtual auto generate(const Finding& finding,
                                      std::string_view target)
      -> std::optional<VerificationCode> = 0;
};

// Bash scripts for open ports and exposed paths, a python SQL error check for
// injectable parameters, and a python HTTP check for any other finding that
// carries a url or path.
class TemplateVerificationGenerator : public IVerificationGenerator {
public:
  [[nodiscard]] auto generate(const Finding& finding, std::string_view target)
      -> std::optional<VerificationCode> override;
};

}  // namespace vigil
