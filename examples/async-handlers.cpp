#include <switchyard/switchyard.hpp>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace switchyard;

namespace {

// Mock database: user store
struct User {
  int id;
  std::string name;
  std::string email;
};

const std::unordered_map<int, User> users{
    {1, {1, "Alice", "alice@example.com"}},
    {2, {2, "Bob", "bob@example.com"}},
    {3, {3, "Charlie", "charlie@example.com"}},
};

// Simulates a blocking database lookup (e.g., network call to a remote DB).
std::optional<User> simulateDatabaseLookup(int userId) {
  // Simulate network latency
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  auto it = users.find(userId);
  if (it == users.end()) {
    return std::nullopt;
  }
  return it->second;
}

// GET /users/_ : runs the lookup on a background thread and suspends until it completes,
// leaving the driving loop free to progress other requests meanwhile.
RequestTask<HttpResponse> GetUser(PathParams params, HttpRequest &) {
  const int id = std::stoi(params[0]);
  auto lookup = std::async(std::launch::async, [id]() { return simulateDatabaseLookup(id); });
  while (lookup.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
    co_await std::suspend_always{};
  }

  std::optional<User> user = lookup.get();
  if (!user) {
    co_return HttpResponse(http::StatusCodeNotFound).body("User not found\n");
  }
  co_return HttpResponse("ID: " + std::to_string(user->id) + "\nName: " + user->name + "\nEmail: " + user->email +
                         "\n");
}

// GET /fail : handler failure converted by the internal error handler.
RequestTask<HttpResponse> Fail(PathParams, HttpRequest &) {
  throw std::runtime_error("database unavailable");
  co_return HttpResponse();
}

// GET /health : completes without suspending
RequestTask<HttpResponse> Health(PathParams, HttpRequest &) { co_return HttpResponse("OK\n"); }

struct InFlight {
  HttpRequest request;
  RequestTask<HttpResponse> task;
};

}  // namespace

int main() {
  Router router = RouterBuilder(RouterConfig{}
                                    .withInternalErrorHandler(DefaultInternalErrorHandler)
                                    .withNotFoundHandler([](const HttpRequest &) {
                                      return HttpResponse(http::StatusCodeNotFound).body("Not found\n");
                                    }))
                      .registerRoute(http::Method::GET, "/users/_", GetUser)
                      .registerRoute(http::Method::GET, "/health", Health)
                      .registerRoute(http::Method::GET, "/fail", Fail)
                      .build();

  static constexpr std::string_view kTargets[] = {"/users/1", "/users/2", "/users/9", "/health", "/fail", "/nowhere"};

  // Requests are stored in a stable container: tasks refer to them until completion.
  std::vector<InFlight> inFlight;
  inFlight.reserve(std::size(kTargets));
  for (std::string_view target : kTargets) {
    inFlight.push_back(InFlight{HttpRequest(http::Method::GET, target), {}});
  }

  try {
    for (auto &entry : inFlight) {
      entry.task = router.dispatch(entry.request);
    }

    // Single threaded driving loop, resuming each pending task in turn.
    std::size_t nbPending = inFlight.size();
    while (nbPending != 0) {
      nbPending = 0;
      for (auto &entry : inFlight) {
        entry.task.resume();
        if (!entry.task.done()) {
          ++nbPending;
        }
      }
    }

    for (auto &entry : inFlight) {
      HttpResponse resp = entry.task.runSynchronously();
      std::cout << "GET " << entry.request.path() << " -> " << resp.status() << ' ' << resp.reason() << '\n'
                << resp.body() << '\n';
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
