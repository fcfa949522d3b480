#include "command_builder.hpp"

namespace relay_service {

namespace {

bool isBlank(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

} // namespace

std::expected<std::vector<std::string>, std::string> splitShellWords(std::string_view text) {
  enum class State { Blank, Word, SingleQuoted, DoubleQuoted };

  std::vector<std::string> words;
  std::string current;
  State state = State::Blank;

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    switch (state) {
      case State::Blank:
      case State::Word:
        if (isBlank(c)) {
          if (state == State::Word) {
            words.push_back(std::move(current));
            current.clear();
          }
          state = State::Blank;
        } else if (c == '\'') {
          state = State::SingleQuoted;
        } else if (c == '"') {
          state = State::DoubleQuoted;
        } else if (c == '\\') {
          if (++i == text.size()) {
            return std::unexpected<std::string>("No escaped character");
          }
          current.push_back(text[i]);
          state = State::Word;
        } else {
          current.push_back(c);
          state = State::Word;
        }
        break;

      case State::SingleQuoted:
        if (c == '\'') {
          state = State::Word;
        } else {
          current.push_back(c);
        }
        break;

      case State::DoubleQuoted:
        if (c == '"') {
          state = State::Word;
        } else if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
          current.push_back(text[++i]);
        } else {
          current.push_back(c);
        }
        break;
    }
  }

  if (state == State::SingleQuoted || state == State::DoubleQuoted) {
    return std::unexpected<std::string>("No closing quotation");
  }
  if (state == State::Word) {
    words.push_back(std::move(current));
  }
  return words;
}

std::expected<std::vector<std::string>, std::string> buildTranscodeCommand(
  const std::string& binary_path,
  const std::string& input_path,
  std::string_view instruction,
  const std::string& output_path
) {
  auto words = splitShellWords(instruction);
  if (!words) {
    return std::unexpected(words.error());
  }

  std::vector<std::string> command{binary_path, "-i", input_path};
  command.insert(command.end(),
                 std::make_move_iterator(words->begin()),
                 std::make_move_iterator(words->end()));
  command.push_back(output_path);
  return command;
}

} // namespace relay_service
