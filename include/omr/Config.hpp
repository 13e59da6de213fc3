#ifndef OMR_CONFIG_HPP
#define OMR_CONFIG_HPP

#include "omr/AnswerKey.hpp"
#include "omr/ScoringEngine.hpp"
#include "omr/SheetProcessor.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace omr {

// Reads a pipeline configuration (YAML, or JSON as a YAML subset). The layout
// section is required; every other key falls back to its struct default.
// Throws OmrError(ConfigurationError).
PipelineConfig parseConfig(const YAML::Node& root);
PipelineConfig loadConfig(const std::string& path);

// Mapping of question number to option, either an index (0 = A) or a letter:
//   {"1": 0, "2": "C"}   or   {letters: "ACBD-A"}
// Options must be below layout.optionsPerQuestion.
AnswerKey parseAnswerKey(const YAML::Node& root, const Layout& layout);
AnswerKey loadAnswerKey(const std::string& path, const Layout& layout);

YAML::Node reportToYaml(const ScoreReport& report);
std::string emitReport(const ScoreReport& report);

} // namespace omr

#endif // OMR_CONFIG_HPP
