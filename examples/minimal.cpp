#include <switchyard/switchyard.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

using namespace switchyard;

namespace {

RequestTask<HttpResponse> Hello(PathParams, HttpRequest &req) {
  co_return HttpResponse(std::string("Hello from switchyard! You requested ") + std::string(req.path()) + "\n");
}

RequestTask<HttpResponse> GetUser(PathParams params, HttpRequest &) {
  co_return HttpResponse("User " + params[0] + "\n");
}

RequestTask<HttpResponse> GetUserPost(PathParams params, HttpRequest &) {
  co_return HttpResponse("Post " + params[1] + " of user " + params[0] + "\n");
}

}  // namespace

// Routes a single request given on the command line and prints the response.
// Usage: minimal [METHOD] [TARGET]
//   minimal GET /users/42/posts/7
int main(int argc, char **argv) {
  std::string_view method = argc > 1 ? argv[1] : "GET";
  std::string_view target = argc > 2 ? argv[2] : "/";

  try {
    Router router = RouterBuilder()
                        .registerRoute(http::Method::GET, "/", Hello)
                        .registerRoute(http::Method::GET, {"users", "_"}, GetUser)
                        .registerRoute(http::Method::GET, {"users", "_", "posts", "_"}, GetUserPost)
                        .build();

    const auto optMethod = http::MethodStrToOptEnum(method);
    if (!optMethod) {
      std::cerr << "Unknown method: " << method << '\n';
      return EXIT_FAILURE;
    }

    HttpRequest req(*optMethod, target);
    HttpResponse resp = router.dispatch(req).runSynchronously();

    std::cout << resp.status() << ' ' << resp.reason() << '\n';
    for (const auto &header : resp.headers()) {
      std::cout << header.raw() << '\n';
    }
    std::cout << '\n' << resp.body();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
