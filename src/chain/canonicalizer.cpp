#include <flightledger/chain/canonical_writer.hpp>
#include <flightledger/chain/canonicalizer.hpp>
#include <flightledger/common/error.hpp>

#include <algorithm>
#include <bit>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace flightledger::schema;

namespace flightledger::chain {

namespace {

enum class value_tag : uint8_t {
  null = 0,
  boolean = 1,
  signed_integer = 2,
  unsigned_integer = 3,
  floating_point = 4,
  string = 5,
  bytes = 6,
  list = 7,
  structure = 8,
};

class value_encoder final {
 public:
  value_encoder(canonical_writer& writer, std::optional<uint64_t> index)
      : writer_{writer}, index_{index} {}

  void name(const std::string_view& name) {
    if (name.empty()) {
      fail("field name must not be empty");
    }
    text(name);
  }

  void text(const std::string_view& str) {
    check_length(str.size());
    if (!is_valid_utf8(str)) {
      fail("string is not valid UTF-8");
    }
    writer_.write_string(str);
  }

  void value(const field_value& v, const std::size_t depth) {
    if (depth > kMaxFieldDepth) {
      fail("field value nesting exceeds the supported depth");
    }
    std::visit(
        overloaded{
            [&](const null_value_t&) { tag(value_tag::null); },
            [&](const bool b) {
              tag(value_tag::boolean);
              writer_.write(static_cast<uint8_t>(b ? 1 : 0));
            },
            [&](const int64_t i) {
              tag(value_tag::signed_integer);
              writer_.write(i);
            },
            [&](const uint64_t u) {
              tag(value_tag::unsigned_integer);
              writer_.write(u);
            },
            [&](const double d) {
              if (std::isnan(d)) {
                fail("NaN has no canonical encoding");
              }
              tag(value_tag::floating_point);
              auto normalized = d == 0.0 ? 0.0 : d;
              writer_.write(std::bit_cast<uint64_t>(normalized));
            },
            [&](const std::string& s) {
              tag(value_tag::string);
              text(s);
            },
            [&](const bytes_t& b) {
              check_length(b.size());
              tag(value_tag::bytes);
              writer_.write_bytes(b);
            },
            [&](const field_list_t& list) {
              check_length(list.size());
              tag(value_tag::list);
              writer_.write(static_cast<uint32_t>(list.size()));
              for (const auto& item : list) {
                value(item, depth + 1);
              }
            },
            [&](const field_structure_t& members) {
              check_length(members.size());
              tag(value_tag::structure);
              writer_.write(static_cast<uint32_t>(members.size()));
              for (const auto* member : sorted_members(members)) {
                name(member->name);
                value(member->value, depth + 1);
              }
            }},
        v.value);
  }

 private:
  void tag(const value_tag t) { writer_.write(static_cast<uint8_t>(t)); }

  void check_length(const std::size_t size) {
    if (size > std::numeric_limits<uint32_t>::max()) {
      fail("length exceeds the canonical u32 limit");
    }
  }

  std::vector<const field_member*> sorted_members(
      const field_structure_t& members) {
    auto sorted = std::vector<const field_member*>{};
    sorted.reserve(members.size());
    for (const auto& member : members) {
      sorted.push_back(&member);
    }
    std::ranges::sort(sorted, [](const auto* lhs, const auto* rhs) {
      return lhs->name < rhs->name;
    });
    auto duplicate = std::ranges::adjacent_find(
        sorted, [](const auto* lhs, const auto* rhs) {
          return lhs->name == rhs->name;
        });
    if (duplicate != std::end(sorted)) {
      fail("duplicate structure member '" + (*duplicate)->name + "'");
    }
    return sorted;
  }

  [[noreturn]] void fail(const std::string& message) const {
    throw flightledger::common::malformed_input_error{message, index_};
  }

  canonical_writer& writer_;
  std::optional<uint64_t> index_;
};

}  // namespace

canonical_entry_t canonicalize(const log_entry_t& entry) {
  if (entry.entry_type.empty()) {
    throw flightledger::common::malformed_input_error{
        "entry type tag must not be empty", entry.index};
  }

  auto writer = canonical_writer{};
  auto encoder = value_encoder{writer, entry.index};
  writer.write(kCanonicalFormatVersion);
  writer.write(entry.index);
  writer.write(entry.timestamp);
  encoder.text(entry.entry_type);

  if (entry.fields.size() > std::numeric_limits<uint32_t>::max()) {
    throw flightledger::common::malformed_input_error{
        "too many fields for the canonical layout", entry.index};
  }
  writer.write(static_cast<uint32_t>(entry.fields.size()));
  // std::map orders std::string keys with char_traits<char>::compare, which
  // compares as unsigned bytes: the same order as the canonical layout.
  for (const auto& [name, value] : entry.fields) {
    encoder.name(name);
    encoder.value(value, 1);
  }

  return canonical_entry_t{.index = entry.index,
                           .bytes = std::move(writer.data)};
}

bytes_t canonicalize_value(const field_value& value) {
  auto writer = canonical_writer{};
  auto encoder = value_encoder{writer, std::nullopt};
  encoder.value(value, 1);
  return std::move(writer.data);
}

bool is_valid_utf8(const std::string_view text) {
  auto i = std::size_t{0};
  while (i < text.size()) {
    const auto lead = static_cast<uint8_t>(text[i]);
    if (lead < 0x80u) {
      ++i;
      continue;
    }

    auto length = std::size_t{0};
    auto code_point = uint32_t{0};
    auto minimum = uint32_t{0};
    if ((lead & 0xE0u) == 0xC0u) {
      length = 2;
      code_point = lead & 0x1Fu;
      minimum = 0x80u;
    } else if ((lead & 0xF0u) == 0xE0u) {
      length = 3;
      code_point = lead & 0x0Fu;
      minimum = 0x800u;
    } else if ((lead & 0xF8u) == 0xF0u) {
      length = 4;
      code_point = lead & 0x07u;
      minimum = 0x10000u;
    } else {
      return false;
    }
    if (i + length > text.size()) {
      return false;
    }
    for (auto k = std::size_t{1}; k < length; ++k) {
      const auto continuation = static_cast<uint8_t>(text[i + k]);
      if ((continuation & 0xC0u) != 0x80u) {
        return false;
      }
      code_point = (code_point << 6u) | (continuation & 0x3Fu);
    }
    if (code_point < minimum || code_point > 0x10FFFFu ||
        (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
      return false;
    }
    i += length;
  }
  return true;
}

}  // namespace flightledger::chain
