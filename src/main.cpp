#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

#include "stoatwh/commands.hpp"
#include "stoatwh/config.hpp"
#include "stoatwh/http.hpp"

namespace {

using namespace stoatwh;

void on_interrupt(int) {
  std::_Exit(kExitInterrupted);
}

bool stdin_is_tty() {
#ifdef _WIN32
  return _isatty(_fileno(stdin)) != 0;
#else
  return isatty(fileno(stdin)) != 0;
#endif
}

std::optional<std::string> read_piped_stdin() {
  if (stdin_is_tty()) {
    return std::nullopt;
  }
  std::string text{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, on_interrupt);

  if (log_json_from_env()) {
    Logger::set_json(true);
  }

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.empty()) {
    std::cerr << usage_text();
    return kExitUsage;
  }

  CommandContext ctx;
  ctx.config = load_config();
  HttpClient client(ctx.config.user_agent);
  const int timeout_s = ctx.config.timeout_s;
  ctx.transport = [&client, timeout_s](const HttpRequest& req) { return client.request(req, timeout_s); };
  ctx.read_stdin = read_piped_stdin;

  return run_cli(args, ctx);
}
