#include <bolt/bolt.hpp>
#include <bolt/log.hpp>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

using namespace bolt;

// Dispatches one request given on the command line and prints the recorded response.
// Usage: bolt-minimal [METHOD] [TARGET]
// Example: bolt-minimal GET /users/42?verbose=1
int main(int argc, char **argv) {
  const std::string_view method = argc > 1 ? argv[1] : "GET";
  const std::string_view target = argc > 2 ? argv[2] : "/";

  log::set_level(log::level::debug);

  try {
    Dispatcher dispatcher(BoltConfig{}.withInitialPoolSize(1));

    dispatcher.use([](Context &ctx) {
      const auto start = std::chrono::steady_clock::now();
      ctx.next();
      const auto elapsed =
          std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
      log::info("{} {} served in {} us", ctx.request().method(), ctx.request().path(), elapsed.count());
    });

    dispatcher.get("/", [](Context &ctx) { ctx.response().write("Hello from bolt!\n"); });

    dispatcher.get("/users/:id", [](Context &ctx) {
      ctx.response().addHeader(http::ContentType, http::ContentTypeApplicationJson);
      ctx.response().write(R"({"id":")");
      ctx.response().write(ctx.param("id"));
      ctx.response().write("\"}\n");
    });

    dispatcher.del("/users/:id", [](Context &ctx) { ctx.response().status(http::StatusCodeNoContent); });

    dispatcher.get("/static/*filepath", [](Context &ctx) {
      ctx.response().addHeader(http::ContentType, http::ContentTypeTextPlain);
      ctx.response().write("would serve ");
      ctx.response().write(ctx.param("filepath"));
      ctx.response().write("\n");
    });

    HttpRequest request(method, target);
    HttpResponse response;
    dispatcher.dispatch(request, response);

    std::cout << response.status() << ' ' << http::ReasonPhraseFor(response.status()) << '\n';
    for (const auto &[name, value] : response.headers()) {
      std::cout << name << ": " << value << '\n';
    }
    std::cout << '\n' << response.body();
  } catch (const std::exception &e) {
    std::cerr << "Dispatch failed: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
