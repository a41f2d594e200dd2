#include "internal/model/event.hpp"

#include <vector>

#include "internal/util/errors.hpp"

namespace outbox::model {
namespace {

constexpr char kDelimiter = '|';
constexpr char kEscape    = '\\';

// Splits on unescaped delimiters. Escape sequences are kept as-is.
std::vector<std::string_view> SplitFields(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t                   start = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == kEscape) {
      ++i;
      continue;
    }
    if (line[i] == kDelimiter) {
      fields.push_back(line.substr(start, i - start));
      start = i + 1;
    }
  }
  fields.push_back(line.substr(start));
  return fields;
}

} // namespace

Event::Event(std::string event_id, std::string event_payload) : id(std::move(event_id)), payload(std::move(event_payload)) {
}

std::string EscapeField(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    switch (c) {
      case kEscape:
        out += "\\\\";
        break;
      case kDelimiter:
        out += "\\|";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::string UnescapeField(std::string_view escaped) {
  std::string out;
  out.reserve(escaped.size());
  for (std::size_t i = 0; i < escaped.size(); ++i) {
    char c = escaped[i];
    if (c != kEscape) {
      out.push_back(c);
      continue;
    }
    if (i + 1 >= escaped.size()) {
      throw util::ParseError("dangling escape at end of field");
    }
    char next = escaped[++i];
    switch (next) {
      case '\\':
        out.push_back('\\');
        break;
      case '|':
        out.push_back('|');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      default:
        throw util::ParseError(std::string("unknown escape sequence \\") + next);
    }
  }
  return out;
}

std::string Event::Serialize() const {
  std::string line = EscapeField(id);
  line.push_back(kDelimiter);
  line += EscapeField(payload);
  line.push_back(kDelimiter);
  line += ToString(status);
  if (status == EventStatus::kFailed && !failure_reason.empty()) {
    line.push_back(':');
    line += EscapeField(failure_reason);
  }
  return line;
}

Event Event::Parse(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }

  auto fields = SplitFields(line);
  if (fields.size() != 3) {
    throw util::ParseError("expected 3 fields, got " + std::to_string(fields.size()));
  }

  Event event;
  event.id = UnescapeField(fields[0]);
  if (event.id.empty()) {
    throw util::ParseError("empty event id");
  }
  event.payload = UnescapeField(fields[1]);

  std::string_view status_field = fields[2];
  std::string_view token        = status_field;
  std::string_view reason;
  if (auto colon = status_field.find(':'); colon != std::string_view::npos) {
    token  = status_field.substr(0, colon);
    reason = status_field.substr(colon + 1);
  }

  auto status = ParseStatus(token);
  if (!status) {
    throw util::ParseError("unknown status token '" + std::string(token) + "'");
  }
  if (!reason.empty() && *status != EventStatus::kFailed) {
    throw util::ParseError("only failed records carry a reason");
  }

  event.status         = *status;
  event.failure_reason = UnescapeField(reason);
  return event;
}

bool operator==(const Event& lhs, const Event& rhs) {
  return lhs.id == rhs.id && lhs.payload == rhs.payload && lhs.status == rhs.status && lhs.failure_reason == rhs.failure_reason;
}

} // namespace outbox::model
