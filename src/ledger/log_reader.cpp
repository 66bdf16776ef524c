#include <credo/ledger/log_reader.hpp>

#include <charconv>
#include <fstream>
#include <sstream>

namespace credo::ledger {

namespace {

std::string_view trim(std::string_view value) {
  const auto whitespace = std::string_view{" \t\r\n"};
  auto begin = value.find_first_not_of(whitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = value.find_last_not_of(whitespace);
  return value.substr(begin, end - begin + 1);
}

std::optional<uint64_t> parse_u64(const std::string_view value) {
  auto parsed = uint64_t{};
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::string line_error(const size_t line_number, const std::string_view what) {
  return "line " + std::to_string(line_number) + ": " + std::string{what};
}

}  // namespace

std::optional<std::vector<ledger_block>> parse_ledger(std::istream& input,
                                                      std::string& error) {
  auto blocks = std::vector<ledger_block>{};
  auto line = std::string{};
  auto line_number = size_t{0};
  while (std::getline(input, line)) {
    ++line_number;
    auto content = trim(line);
    if (content.empty() || content.front() == '#') {
      continue;
    }

    auto fields = std::vector<std::string_view>{};
    while (!content.empty()) {
      auto split = content.find_first_of(" \t");
      fields.push_back(content.substr(0, split));
      if (split == std::string_view::npos) {
        break;
      }
      content = trim(content.substr(split));
    }
    if (fields.size() != 3) {
      error = line_error(line_number,
                         "expected '<height> <block_time_ms> <base64 tx>'");
      return std::nullopt;
    }

    auto height = parse_u64(fields[0]);
    auto block_time = parse_u64(fields[1]);
    if (!height || !block_time) {
      error = line_error(line_number, "height and block time must be integers");
      return std::nullopt;
    }
    auto tx = credo::schema::try_from_base64(fields[2]);
    if (!tx) {
      error = line_error(line_number, "transaction is not valid base64");
      return std::nullopt;
    }

    if (!blocks.empty() && blocks.back().height == *height) {
      if (blocks.back().block_time != *block_time) {
        error = line_error(line_number, "block time differs within a block");
        return std::nullopt;
      }
      blocks.back().txs.push_back(std::move(*tx));
      continue;
    }
    if (!blocks.empty() && blocks.back().height > *height) {
      error = line_error(line_number, "block height decreased");
      return std::nullopt;
    }
    blocks.push_back(ledger_block{
        .height = *height, .block_time = *block_time, .txs = {std::move(*tx)}});
  }
  return blocks;
}

std::optional<std::vector<ledger_block>> load_ledger(const std::string_view path,
                                                     std::string& error) {
  auto input = std::ifstream{std::string{path}};
  if (!input.is_open()) {
    error = "unable to open ledger file '" + std::string{path} + "'";
    return std::nullopt;
  }
  return parse_ledger(input, error);
}

std::string format_ledger_line(
    const uint64_t height,
    const credo::schema::timestamp_milliseconds_t block_time,
    const credo::schema::bytes_t& tx) {
  auto out = std::ostringstream{};
  out << height << ' ' << block_time << ' ' << credo::schema::to_base64(tx);
  return out.str();
}

}  // namespace credo::ledger
