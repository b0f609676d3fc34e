#include "json_bridge.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace recall::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.is_object()) {
    return false;
  }
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return false;
  }
  setter(*it);
  return true;
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object()) {
    throw std::invalid_argument("Expected object with field '" + std::string(key) + "'");
  }
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    throw std::invalid_argument("Missing field '" + std::string(key) + "'");
  }
  return *it;
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  constexpr auto kMin = std::numeric_limits<int>::min();
  constexpr auto kMax = std::numeric_limits<int>::max();
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v <= static_cast<std::uint64_t>(kMax)) {
      return static_cast<int>(v);
    }
  } else if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v >= kMin && v <= kMax) {
      return static_cast<int>(v);
    }
  } else if (value.is_number_float()) {
    const double v = value.get<double>();
    if (std::isfinite(v) && std::trunc(v) == v && v >= kMin && v <= kMax) {
      return static_cast<int>(v);
    }
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::int64_t json_to_int64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (v <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return static_cast<std::int64_t>(v);
    }
  } else if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  } else if (value.is_number_float()) {
    // 2^63 is exactly representable; anything at or above it overflows.
    const double v = value.get<double>();
    if (std::isfinite(v) && std::trunc(v) == v && v >= -9223372036854775808.0 &&
        v < 9223372036854775808.0) {
      return static_cast<std::int64_t>(v);
    }
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::uint64_t json_to_uint64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(value.get<std::int64_t>());
  }
  throw std::invalid_argument("Expected non-negative integer for field '" + std::string(key) +
                              "'");
}

std::size_t json_to_index(const nlohmann::json& value, std::string_view key) {
  return static_cast<std::size_t>(json_to_uint64(value, key));
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<std::string> json_to_string_vector(const nlohmann::json& value,
                                               std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(json_to_string(entry, key));
  }
  return out;
}

std::set<std::string> json_to_string_set(const nlohmann::json& value, std::string_view key) {
  auto values = json_to_string_vector(value, key);
  return std::set<std::string>(values.begin(), values.end());
}

std::set<std::size_t> json_to_index_set(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<int> for field '" + std::string(key) + "'");
  }
  std::set<std::size_t> out;
  for (const auto& entry : value) {
    out.insert(json_to_index(entry, key));
  }
  return out;
}

std::string string_or_empty(const nlohmann::json& obj, const char* key) {
  std::string out;
  assign_if_present(obj, key, [&](const nlohmann::json& v) { out = json_to_string(v, key); });
  return out;
}

nlohmann::json optional_timestamp(const std::optional<TimestampMs>& value) {
  return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<TimestampMs> optional_timestamp_from(const nlohmann::json& obj, const char* key) {
  std::optional<TimestampMs> out;
  assign_if_present(obj, key, [&](const nlohmann::json& v) { out = json_to_int64(v, key); });
  return out;
}

// --- payloads ---

nlohmann::json options_to_json(const std::vector<ChoiceOption>& options) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& option : options) {
    out.push_back({{"id", option.id}, {"text", option.text}});
  }
  return out;
}

std::vector<ChoiceOption> options_from_json(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array of options for field '" + std::string(key) + "'");
  }
  std::vector<ChoiceOption> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    ChoiceOption option;
    option.id = json_to_string(require_field(entry, "id"), "id");
    option.text = string_or_empty(entry, "text");
    out.push_back(std::move(option));
  }
  return out;
}

nlohmann::json payload_to_json(const Payload& payload) {
  return std::visit(
      [](const auto& p) -> nlohmann::json {
        using T = std::decay_t<decltype(p)>;
        nlohmann::json out = nlohmann::json::object();
        if constexpr (std::is_same_v<T, MultipleChoicePayload>) {
          out["question"] = p.question;
          out["options"] = options_to_json(p.options);
          out["correct_option_id"] = p.correct_option_id;
        } else if constexpr (std::is_same_v<T, MultiSelectPayload>) {
          out["question"] = p.question;
          out["options"] = options_to_json(p.options);
          out["correct_option_ids"] = p.correct_option_ids;
        } else if constexpr (std::is_same_v<T, ClozePayload>) {
          out["text"] = p.text;
          nlohmann::json blanks = nlohmann::json::array();
          for (const auto& blank : p.blanks) {
            blanks.push_back({{"answer", blank.answer}, {"alternatives", blank.alternatives}});
          }
          out["blanks"] = std::move(blanks);
        } else if constexpr (std::is_same_v<T, MatchingPayload>) {
          out["question"] = p.question;
          nlohmann::json pairs = nlohmann::json::array();
          for (const auto& pair : p.pairs) {
            pairs.push_back({{"left_id", pair.left_id},
                             {"left", pair.left},
                             {"right_id", pair.right_id},
                             {"right", pair.right}});
          }
          out["pairs"] = std::move(pairs);
        } else if constexpr (std::is_same_v<T, OrderingPayload>) {
          out["question"] = p.question;
          out["items"] = options_to_json(p.items);
          out["correct_order"] = p.correct_order;
        } else if constexpr (std::is_same_v<T, TrueFalsePayload>) {
          out["statement"] = p.statement;
          out["answer"] = p.answer;
        } else if constexpr (std::is_same_v<T, SliderPayload>) {
          out["question"] = p.question;
          out["min"] = p.min;
          out["max"] = p.max;
          out["step"] = p.step;
          out["target"] = p.target;
          out["tolerance"] = p.tolerance;
          out["unit"] = p.unit;
        } else if constexpr (std::is_same_v<T, TextInputPayload>) {
          out["question"] = p.question;
          out["accepted"] = p.accepted;
          out["case_sensitive"] = p.case_sensitive;
        } else if constexpr (std::is_same_v<T, WordScramblePayload>) {
          out["question"] = p.question;
          out["scrambled"] = p.scrambled;
          out["target"] = p.target;
          out["show_length"] = p.show_length;
        } else if constexpr (std::is_same_v<T, ErrorDetectionPayload>) {
          out["segments"] = p.segments;
          out["error_indices"] = p.error_indices;
        } else if constexpr (std::is_same_v<T, FlashcardPayload>) {
          out["front"] = p.front;
          out["back"] = p.back;
          out["front_language"] = p.front_language;
          out["back_language"] = p.back_language;
        }
        return out;
      },
      payload);
}

Payload payload_from_json(Variant variant, const nlohmann::json& json) {
  switch (variant) {
    case Variant::MultipleChoice: {
      MultipleChoicePayload p;
      p.question = string_or_empty(json, "question");
      p.options = options_from_json(require_field(json, "options"), "options");
      p.correct_option_id =
          json_to_string(require_field(json, "correct_option_id"), "correct_option_id");
      return p;
    }
    case Variant::MultiSelect: {
      MultiSelectPayload p;
      p.question = string_or_empty(json, "question");
      p.options = options_from_json(require_field(json, "options"), "options");
      p.correct_option_ids =
          json_to_string_set(require_field(json, "correct_option_ids"), "correct_option_ids");
      return p;
    }
    case Variant::ClozeDeletion: {
      ClozePayload p;
      p.text = string_or_empty(json, "text");
      const auto& blanks = require_field(json, "blanks");
      if (!blanks.is_array()) {
        throw std::invalid_argument("Expected array for field 'blanks'");
      }
      for (const auto& entry : blanks) {
        ClozeBlank blank;
        if (entry.is_string()) {
          blank.answer = entry.get<std::string>();
        } else {
          blank.answer = json_to_string(require_field(entry, "answer"), "answer");
          assign_if_present(entry, "alternatives", [&](const nlohmann::json& v) {
            blank.alternatives = json_to_string_vector(v, "alternatives");
          });
        }
        p.blanks.push_back(std::move(blank));
      }
      return p;
    }
    case Variant::Matching: {
      MatchingPayload p;
      p.question = string_or_empty(json, "question");
      const auto& pairs = require_field(json, "pairs");
      if (!pairs.is_array()) {
        throw std::invalid_argument("Expected array for field 'pairs'");
      }
      for (const auto& entry : pairs) {
        MatchPair pair;
        pair.left_id = json_to_string(require_field(entry, "left_id"), "left_id");
        pair.left = string_or_empty(entry, "left");
        pair.right_id = json_to_string(require_field(entry, "right_id"), "right_id");
        pair.right = string_or_empty(entry, "right");
        p.pairs.push_back(std::move(pair));
      }
      return p;
    }
    case Variant::Ordering: {
      OrderingPayload p;
      p.question = string_or_empty(json, "question");
      p.items = options_from_json(require_field(json, "items"), "items");
      const bool has_order = assign_if_present(json, "correct_order", [&](const nlohmann::json& v) {
        p.correct_order = json_to_string_vector(v, "correct_order");
      });
      if (!has_order) {
        for (const auto& item : p.items) {
          p.correct_order.push_back(item.id);
        }
      }
      return p;
    }
    case Variant::TrueFalse: {
      TrueFalsePayload p;
      p.statement = string_or_empty(json, "statement");
      p.answer = json_to_bool(require_field(json, "answer"), "answer");
      return p;
    }
    case Variant::Slider: {
      SliderPayload p;
      p.question = string_or_empty(json, "question");
      assign_if_present(json, "min", [&](const nlohmann::json& v) { p.min = json_to_double(v, "min"); });
      assign_if_present(json, "max", [&](const nlohmann::json& v) { p.max = json_to_double(v, "max"); });
      assign_if_present(json, "step", [&](const nlohmann::json& v) { p.step = json_to_double(v, "step"); });
      p.target = json_to_double(require_field(json, "target"), "target");
      assign_if_present(json, "tolerance",
                        [&](const nlohmann::json& v) { p.tolerance = json_to_double(v, "tolerance"); });
      p.unit = string_or_empty(json, "unit");
      return p;
    }
    case Variant::TextInput: {
      TextInputPayload p;
      p.question = string_or_empty(json, "question");
      p.accepted = json_to_string_vector(require_field(json, "accepted"), "accepted");
      assign_if_present(json, "case_sensitive", [&](const nlohmann::json& v) {
        p.case_sensitive = json_to_bool(v, "case_sensitive");
      });
      return p;
    }
    case Variant::WordScramble: {
      WordScramblePayload p;
      p.question = string_or_empty(json, "question");
      p.scrambled = string_or_empty(json, "scrambled");
      p.target = json_to_string(require_field(json, "target"), "target");
      assign_if_present(json, "show_length", [&](const nlohmann::json& v) {
        p.show_length = json_to_bool(v, "show_length");
      });
      return p;
    }
    case Variant::ErrorDetection: {
      ErrorDetectionPayload p;
      p.segments = json_to_string_vector(require_field(json, "segments"), "segments");
      assign_if_present(json, "error_indices", [&](const nlohmann::json& v) {
        p.error_indices = json_to_index_set(v, "error_indices");
      });
      return p;
    }
    case Variant::Flashcard: {
      FlashcardPayload p;
      p.front = json_to_string(require_field(json, "front"), "front");
      p.back = json_to_string(require_field(json, "back"), "back");
      p.front_language = string_or_empty(json, "front_language");
      p.back_language = string_or_empty(json, "back_language");
      return p;
    }
  }
  throw std::invalid_argument("Unhandled variant");
}

// Rejects payloads whose own canonical answer would not grade as correct.
void check_payload(const Payload& payload) {
  std::visit(
      [](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, MultipleChoicePayload> ||
                      std::is_same_v<T, MultiSelectPayload>) {
          std::set<std::string> ids;
          for (const auto& option : p.options) {
            ids.insert(option.id);
          }
          if constexpr (std::is_same_v<T, MultipleChoicePayload>) {
            if (ids.count(p.correct_option_id) == 0) {
              throw std::invalid_argument("correct_option_id '" + p.correct_option_id +
                                          "' is not one of the options");
            }
          } else {
            for (const auto& id : p.correct_option_ids) {
              if (ids.count(id) == 0) {
                throw std::invalid_argument("correct_option_ids entry '" + id +
                                            "' is not one of the options");
              }
            }
          }
        } else if constexpr (std::is_same_v<T, MatchingPayload>) {
          std::set<std::string> left_ids;
          for (const auto& pair : p.pairs) {
            if (!left_ids.insert(pair.left_id).second) {
              throw std::invalid_argument("duplicate left_id '" + pair.left_id + "'");
            }
          }
        } else if constexpr (std::is_same_v<T, OrderingPayload>) {
          std::vector<std::string> expected;
          for (const auto& item : p.items) {
            expected.push_back(item.id);
          }
          std::vector<std::string> order = p.correct_order;
          std::sort(expected.begin(), expected.end());
          std::sort(order.begin(), order.end());
          if (order != expected ||
              std::adjacent_find(order.begin(), order.end()) != order.end()) {
            throw std::invalid_argument("correct_order must be a permutation of the item ids");
          }
        } else if constexpr (std::is_same_v<T, TextInputPayload>) {
          if (p.accepted.empty()) {
            throw std::invalid_argument("accepted must list at least one answer");
          }
        } else if constexpr (std::is_same_v<T, ErrorDetectionPayload>) {
          for (const auto index : p.error_indices) {
            if (index >= p.segments.size()) {
              throw std::invalid_argument("error index " + std::to_string(index) +
                                          " out of range (" + std::to_string(p.segments.size()) +
                                          " segments)");
            }
          }
        }
      },
      payload);
}

// --- sessions ---

nlohmann::json breakdown_map_to_json(const std::map<Variant, VariantBreakdown>& stats) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& entry : stats) {
    out[to_string(entry.first)] = {{"attempted", entry.second.attempted},
                                   {"correct", entry.second.correct},
                                   {"total_time_ms", entry.second.total_time_ms},
                                   {"score_sum", entry.second.score_sum}};
  }
  return out;
}

std::map<Variant, VariantBreakdown> breakdown_map_from_json(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::invalid_argument("Expected object of per-variant statistics");
  }
  std::map<Variant, VariantBreakdown> out;
  for (auto it = json.begin(); it != json.end(); ++it) {
    VariantBreakdown breakdown;
    const auto& value = it.value();
    breakdown.attempted = json_to_int(require_field(value, "attempted"), "attempted");
    breakdown.correct = json_to_int(require_field(value, "correct"), "correct");
    assign_if_present(value, "total_time_ms", [&](const nlohmann::json& v) {
      breakdown.total_time_ms = json_to_int64(v, "total_time_ms");
    });
    assign_if_present(value, "score_sum", [&](const nlohmann::json& v) {
      breakdown.score_sum = json_to_double(v, "score_sum");
    });
    out[variant_from_string(it.key())] = breakdown;
  }
  return out;
}

nlohmann::json execution_to_json(const SessionExecution& execution) {
  nlohmann::json out = nlohmann::json::object();
  out["task_ids"] = execution.task_ids;
  out["cursor"] = execution.cursor;
  out["phase"] = to_string(execution.phase);
  out["completed_count"] = execution.completed_count;
  out["correct_count"] = execution.correct_count;
  out["skipped_count"] = execution.skipped_count;
  out["hints_used"] = execution.hints_used;
  out["total_time_ms"] = execution.total_time_ms;
  out["status"] = to_string(execution.status);
  out["started_at"] = optional_timestamp(execution.started_at);
  out["completed_at"] = optional_timestamp(execution.completed_at);
  out["presented_at"] = optional_timestamp(execution.presented_at);
  out["variant_stats"] = breakdown_map_to_json(execution.variant_stats);
  return out;
}

SessionExecution execution_from_json(const nlohmann::json& json) {
  SessionExecution execution;
  execution.task_ids = json_to_string_vector(require_field(json, "task_ids"), "task_ids");
  assign_if_present(json, "cursor",
                    [&](const nlohmann::json& v) { execution.cursor = json_to_index(v, "cursor"); });
  assign_if_present(json, "phase", [&](const nlohmann::json& v) {
    execution.phase = task_phase_from_string(json_to_string(v, "phase"));
  });
  assign_if_present(json, "completed_count", [&](const nlohmann::json& v) {
    execution.completed_count = json_to_int(v, "completed_count");
  });
  assign_if_present(json, "correct_count", [&](const nlohmann::json& v) {
    execution.correct_count = json_to_int(v, "correct_count");
  });
  assign_if_present(json, "skipped_count", [&](const nlohmann::json& v) {
    execution.skipped_count = json_to_int(v, "skipped_count");
  });
  assign_if_present(json, "hints_used", [&](const nlohmann::json& v) {
    execution.hints_used = json_to_int(v, "hints_used");
  });
  assign_if_present(json, "total_time_ms", [&](const nlohmann::json& v) {
    execution.total_time_ms = json_to_int64(v, "total_time_ms");
  });
  execution.status = session_status_from_string(json_to_string(require_field(json, "status"), "status"));
  execution.started_at = optional_timestamp_from(json, "started_at");
  execution.completed_at = optional_timestamp_from(json, "completed_at");
  execution.presented_at = optional_timestamp_from(json, "presented_at");
  assign_if_present(json, "variant_stats", [&](const nlohmann::json& v) {
    execution.variant_stats = breakdown_map_from_json(v);
  });
  return execution;
}

nlohmann::json results_to_json(const SessionResults& results) {
  return {{"accuracy", results.accuracy},
          {"average_time_ms", results.average_time_ms},
          {"by_variant", breakdown_map_to_json(results.by_variant)}};
}

SessionResults results_from_json(const nlohmann::json& json) {
  SessionResults results;
  assign_if_present(json, "accuracy",
                    [&](const nlohmann::json& v) { results.accuracy = json_to_double(v, "accuracy"); });
  assign_if_present(json, "average_time_ms", [&](const nlohmann::json& v) {
    results.average_time_ms = json_to_double(v, "average_time_ms");
  });
  assign_if_present(json, "by_variant", [&](const nlohmann::json& v) {
    results.by_variant = breakdown_map_from_json(v);
  });
  return results;
}

} // namespace

nlohmann::json to_json(const ContentItem& item) {
  nlohmann::json out = nlohmann::json::object();
  out["id"] = item.id;
  out["variant"] = to_string(item.variant());
  out["topic_id"] = item.topic_id;
  out["learning_path_id"] = item.learning_path_id;
  out["hint"] = item.hint.has_value() ? nlohmann::json(*item.hint) : nlohmann::json(nullptr);
  out["explanation"] =
      item.explanation.has_value() ? nlohmann::json(*item.explanation) : nlohmann::json(nullptr);
  out["payload"] = payload_to_json(item.payload);
  return out;
}

ContentItem content_item_from_json(const nlohmann::json& json_item) {
  ContentItem item;
  item.id = json_to_string(require_field(json_item, "id"), "id");
  const Variant variant = variant_from_string(json_to_string(require_field(json_item, "variant"), "variant"));
  item.topic_id = string_or_empty(json_item, "topic_id");
  item.learning_path_id = string_or_empty(json_item, "learning_path_id");
  assign_if_present(json_item, "hint",
                    [&](const nlohmann::json& v) { item.hint = json_to_string(v, "hint"); });
  assign_if_present(json_item, "explanation", [&](const nlohmann::json& v) {
    item.explanation = json_to_string(v, "explanation");
  });
  try {
    item.payload = payload_from_json(variant, require_field(json_item, "payload"));
    check_payload(item.payload);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument("Item '" + item.id + "': " + e.what());
  }
  return item;
}

std::vector<ContentItem> load_content_items(const nlohmann::json& document) {
  const nlohmann::json* items = &document;
  if (document.is_object()) {
    items = &require_field(document, "items");
  }
  if (!items->is_array()) {
    throw std::invalid_argument("Expected an array of content items");
  }
  std::vector<ContentItem> out;
  out.reserve(items->size());
  for (const auto& entry : *items) {
    out.push_back(content_item_from_json(entry));
  }
  return out;
}

std::vector<ContentItem> load_content_items_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Unable to open content file: " + path);
  }
  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Failed to parse content file " + path + ": " + e.what());
  }
  return load_content_items(document);
}

nlohmann::json to_json(const Submission& submission) {
  nlohmann::json out = std::visit(
      [](const auto& s) -> nlohmann::json {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SelectedOption>) {
          return {{"option_id", s.option_id}};
        } else if constexpr (std::is_same_v<T, SelectedOptions>) {
          return {{"option_ids", s.option_ids}};
        } else if constexpr (std::is_same_v<T, BlankAnswers>) {
          return {{"blanks", s.blanks}};
        } else if constexpr (std::is_same_v<T, PairAssignments>) {
          return {{"pairs", s.pairs}};
        } else if constexpr (std::is_same_v<T, SequenceAnswer>) {
          return {{"order", s.order}};
        } else if constexpr (std::is_same_v<T, TruthAnswer>) {
          return {{"value", s.value}};
        } else if constexpr (std::is_same_v<T, NumericAnswer>) {
          return {{"value", s.value}};
        } else if constexpr (std::is_same_v<T, FreeTextAnswer>) {
          return {{"text", s.text}};
        } else if constexpr (std::is_same_v<T, SpanSelection>) {
          return {{"indices", s.indices}};
        } else {
          return {{"known", s.known}};
        }
      },
      submission);
  out["kind"] = submission_kind(submission);
  return out;
}

Submission submission_from_json(const nlohmann::json& json_submission) {
  const std::string kind = json_to_string(require_field(json_submission, "kind"), "kind");
  if (kind == "option") {
    return SelectedOption{json_to_string(require_field(json_submission, "option_id"), "option_id")};
  }
  if (kind == "options") {
    return SelectedOptions{
        json_to_string_set(require_field(json_submission, "option_ids"), "option_ids")};
  }
  if (kind == "blanks") {
    return BlankAnswers{json_to_string_vector(require_field(json_submission, "blanks"), "blanks")};
  }
  if (kind == "pairs") {
    const auto& pairs = require_field(json_submission, "pairs");
    if (!pairs.is_object()) {
      throw std::invalid_argument("Expected object for field 'pairs'");
    }
    PairAssignments assignments;
    for (auto it = pairs.begin(); it != pairs.end(); ++it) {
      assignments.pairs[it.key()] = json_to_string(it.value(), "pairs");
    }
    return assignments;
  }
  if (kind == "sequence") {
    return SequenceAnswer{json_to_string_vector(require_field(json_submission, "order"), "order")};
  }
  if (kind == "truth") {
    return TruthAnswer{json_to_bool(require_field(json_submission, "value"), "value")};
  }
  if (kind == "number") {
    return NumericAnswer{json_to_double(require_field(json_submission, "value"), "value")};
  }
  if (kind == "text") {
    return FreeTextAnswer{json_to_string(require_field(json_submission, "text"), "text")};
  }
  if (kind == "spans") {
    return SpanSelection{json_to_index_set(require_field(json_submission, "indices"), "indices")};
  }
  if (kind == "self_assessment") {
    return SelfAssessment{json_to_bool(require_field(json_submission, "known"), "known")};
  }
  throw std::invalid_argument("Unknown submission kind: " + kind);
}

nlohmann::json to_json(const EvaluationResult& result) {
  return {{"correct", result.correct},
          {"score", result.score},
          {"canonical_answer", to_json(result.canonical_answer)},
          {"canonical_display", result.canonical_display},
          {"time_spent_ms", result.time_spent_ms}};
}

EvaluationResult evaluation_result_from_json(const nlohmann::json& json_result) {
  EvaluationResult result;
  result.correct = json_to_bool(require_field(json_result, "correct"), "correct");
  result.score = json_to_double(require_field(json_result, "score"), "score");
  result.canonical_answer = submission_from_json(require_field(json_result, "canonical_answer"));
  result.canonical_display = string_or_empty(json_result, "canonical_display");
  assign_if_present(json_result, "time_spent_ms", [&](const nlohmann::json& v) {
    result.time_spent_ms = json_to_uint64(v, "time_spent_ms");
  });
  return result;
}

nlohmann::json to_json(const SchedulingRecord& record) {
  nlohmann::json out = nlohmann::json::object();
  out["item_id"] = record.item_id;
  out["ease_factor"] = record.ease_factor;
  out["repetition_count"] = record.repetition_count;
  out["interval_days"] = record.interval_days;
  out["next_due_at"] = record.next_due_at;
  out["last_reviewed_at"] = optional_timestamp(record.last_reviewed_at);
  out["total_reviews"] = record.total_reviews;
  out["lapse_count"] = record.lapse_count;
  out["last_quality"] =
      record.last_quality.has_value() ? nlohmann::json(*record.last_quality) : nlohmann::json(nullptr);
  out["average_accuracy"] = record.average_accuracy;
  out["average_time_ms"] = record.average_time_ms;
  return out;
}

SchedulingRecord scheduling_record_from_json(const nlohmann::json& json_record) {
  SchedulingRecord record;
  record.item_id = json_to_string(require_field(json_record, "item_id"), "item_id");
  record.ease_factor = json_to_double(require_field(json_record, "ease_factor"), "ease_factor");
  record.repetition_count =
      json_to_int(require_field(json_record, "repetition_count"), "repetition_count");
  record.interval_days = json_to_int(require_field(json_record, "interval_days"), "interval_days");
  record.next_due_at = json_to_int64(require_field(json_record, "next_due_at"), "next_due_at");
  record.last_reviewed_at = optional_timestamp_from(json_record, "last_reviewed_at");
  assign_if_present(json_record, "total_reviews", [&](const nlohmann::json& v) {
    record.total_reviews = json_to_int(v, "total_reviews");
  });
  assign_if_present(json_record, "lapse_count", [&](const nlohmann::json& v) {
    record.lapse_count = json_to_int(v, "lapse_count");
  });
  assign_if_present(json_record, "last_quality", [&](const nlohmann::json& v) {
    record.last_quality = json_to_int(v, "last_quality");
  });
  assign_if_present(json_record, "average_accuracy", [&](const nlohmann::json& v) {
    record.average_accuracy = json_to_double(v, "average_accuracy");
  });
  assign_if_present(json_record, "average_time_ms", [&](const nlohmann::json& v) {
    record.average_time_ms = json_to_double(v, "average_time_ms");
  });
  if (!(record.average_accuracy >= 0.0 && record.average_accuracy <= 1.0)) {
    throw std::invalid_argument("average_accuracy must be between 0 and 1");
  }
  if (!(record.average_time_ms >= 0.0)) {
    throw std::invalid_argument("average_time_ms must not be negative");
  }
  return record;
}

nlohmann::json to_json(const SessionConfiguration& configuration) {
  return {{"topic_id", configuration.topic_id},
          {"learning_path_ids", configuration.learning_path_ids},
          {"target_count", configuration.target_count},
          {"include_review", configuration.include_review}};
}

SessionConfiguration session_configuration_from_json(const nlohmann::json& json_configuration) {
  SessionConfiguration configuration;
  configuration.topic_id =
      json_to_string(require_field(json_configuration, "topic_id"), "topic_id");
  assign_if_present(json_configuration, "learning_path_ids", [&](const nlohmann::json& v) {
    configuration.learning_path_ids = json_to_string_vector(v, "learning_path_ids");
  });
  assign_if_present(json_configuration, "target_count", [&](const nlohmann::json& v) {
    configuration.target_count = json_to_int(v, "target_count");
  });
  assign_if_present(json_configuration, "include_review", [&](const nlohmann::json& v) {
    configuration.include_review = json_to_bool(v, "include_review");
  });
  return configuration;
}

nlohmann::json to_json(const PracticeSession& session) {
  return {{"id", session.id},
          {"version", session.version},
          {"configuration", to_json(session.configuration)},
          {"execution", execution_to_json(session.execution)},
          {"results", results_to_json(session.results)}};
}

PracticeSession practice_session_from_json(const nlohmann::json& json_session) {
  PracticeSession session;
  session.id = json_to_string(require_field(json_session, "id"), "id");
  assign_if_present(json_session, "version",
                    [&](const nlohmann::json& v) { session.version = json_to_uint64(v, "version"); });
  session.configuration =
      session_configuration_from_json(require_field(json_session, "configuration"));
  session.execution = execution_from_json(require_field(json_session, "execution"));
  assign_if_present(json_session, "results",
                    [&](const nlohmann::json& v) { session.results = results_from_json(v); });
  return session;
}

nlohmann::json to_json(const SubmitOutcome& outcome) {
  nlohmann::json out = nlohmann::json::object();
  out["result"] = to_json(outcome.result);
  out["updated_record"] = outcome.updated_record.has_value() ? to_json(*outcome.updated_record)
                                                             : nlohmann::json(nullptr);
  out["duplicate"] = outcome.duplicate;
  return out;
}

nlohmann::json to_json(const SessionSnapshot& snapshot) {
  nlohmann::json out = nlohmann::json::object();
  out["session_id"] = snapshot.session_id;
  out["status"] = to_string(snapshot.status);
  out["version"] = snapshot.version;
  out["execution"] = execution_to_json(snapshot.execution);
  out["current_item"] =
      snapshot.current_item.has_value() ? to_json(*snapshot.current_item) : nlohmann::json(nullptr);
  out["phase"] =
      snapshot.phase.has_value() ? nlohmann::json(to_string(*snapshot.phase)) : nlohmann::json(nullptr);
  out["hint_visible"] = snapshot.hint_visible;
  out["hint"] = snapshot.hint.has_value() ? nlohmann::json(*snapshot.hint) : nlohmann::json(nullptr);
  out["last_result"] =
      snapshot.last_result.has_value() ? to_json(*snapshot.last_result) : nlohmann::json(nullptr);
  out["results"] =
      snapshot.results.has_value() ? results_to_json(*snapshot.results) : nlohmann::json(nullptr);
  return out;
}

nlohmann::json to_json(const Composition& composition) {
  return {{"task_ids", composition.task_ids},
          {"due_count", composition.due_count},
          {"new_count", composition.new_count},
          {"target_count", composition.target_count},
          {"underflow", composition.underflow()}};
}

nlohmann::json to_json(const CreatedSession& created) {
  return {{"session_id", created.session_id}, {"composition", to_json(created.composition)}};
}

nlohmann::json to_json(const scheduler::ScheduleStats& stats) {
  return {{"total_items", stats.total_items},
          {"due_now", stats.due_now},
          {"graduated", stats.graduated},
          {"average_interval_days", stats.average_interval_days},
          {"average_lapses", stats.average_lapses},
          {"average_accuracy", stats.average_accuracy}};
}

nlohmann::json to_json(const std::vector<scheduler::DailyLoad>& forecast) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& day : forecast) {
    out.push_back({{"day_offset", day.day_offset},
                   {"window_start", day.window_start},
                   {"due_count", day.due_count},
                   {"estimated_time_ms", day.estimated_time_ms}});
  }
  return out;
}

nlohmann::json to_json(const EngineConfig& config) {
  nlohmann::json scheduler_json = nlohmann::json::object();
  scheduler_json["quality_table"] = {{"excellent", config.scheduler.quality_table.excellent},
                                {"good", config.scheduler.quality_table.good},
                                {"fair", config.scheduler.quality_table.fair}};
  scheduler_json["max_interval_days"] = config.scheduler.max_interval_days.has_value()
                                       ? nlohmann::json(*config.scheduler.max_interval_days)
                                       : nlohmann::json(nullptr);
  return {{"scheduler", scheduler_json},
          {"ordering", to_string(config.ordering)},
          {"seed", config.seed},
          {"session_prefix", config.session_prefix}};
}

EngineConfig engine_config_from_json(const nlohmann::json& json_config) {
  EngineConfig config;
  if (json_config.is_null()) {
    return config;
  }
  if (!json_config.is_object()) {
    throw std::invalid_argument("Expected object for engine config");
  }
  assign_if_present(json_config, "scheduler", [&](const nlohmann::json& scheduler_json) {
    assign_if_present(scheduler_json, "quality_table", [&](const nlohmann::json& table) {
      auto& target = config.scheduler.quality_table;
      assign_if_present(table, "excellent",
                        [&](const nlohmann::json& v) { target.excellent = json_to_double(v, "excellent"); });
      assign_if_present(table, "good",
                        [&](const nlohmann::json& v) { target.good = json_to_double(v, "good"); });
      assign_if_present(table, "fair",
                        [&](const nlohmann::json& v) { target.fair = json_to_double(v, "fair"); });
    });
    assign_if_present(scheduler_json, "max_interval_days", [&](const nlohmann::json& v) {
      config.scheduler.max_interval_days = json_to_int(v, "max_interval_days");
    });
  });
  assign_if_present(json_config, "ordering", [&](const nlohmann::json& v) {
    config.ordering = ordering_mode_from_string(json_to_string(v, "ordering"));
  });
  assign_if_present(json_config, "seed",
                    [&](const nlohmann::json& v) { config.seed = json_to_uint64(v, "seed"); });
  assign_if_present(json_config, "session_prefix", [&](const nlohmann::json& v) {
    config.session_prefix = json_to_string(v, "session_prefix");
  });
  config.validate();
  return config;
}

} // namespace recall::bridge
