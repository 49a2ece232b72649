// Group composition benchmarks:
//  - Composing a flat group with a varying number of units and middleware
//  - Composing nested groups
//  - Calling a handler wrapped by a middleware chain

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "routegroup/group.hpp"
#include "routegroup/handler-unit.hpp"
#include "routegroup/http-request.hpp"
#include "routegroup/http-response.hpp"
#include "routegroup/middleware.hpp"
#include "routegroup/request-handler.hpp"
#include "routegroup/vector.hpp"

namespace routegroup {

namespace {

HttpResponse OkHandler([[maybe_unused]] const HttpRequest& req) { return HttpResponse("OK"); }

Middleware PassThrough() {
  return [](RequestHandler next) -> RequestHandler {
    return [next = std::move(next)](const HttpRequest& req) { return next(req); };
  };
}

vector<std::string> MakePaths(int64_t nbUnits) {
  vector<std::string> paths;
  paths.reserve(static_cast<std::size_t>(nbUnits));
  for (int64_t unitPos = 0; unitPos < nbUnits; ++unitPos) {
    paths.push_back("/resource/" + std::to_string(unitPos));
  }
  return paths;
}

}  // namespace

void BM_ComposeFlatGroup(benchmark::State& st) {
  const auto paths = MakePaths(st.range(0));
  const auto nbMiddleware = st.range(1);
  for (auto _ : st) {
    Group group;
    for (int64_t mwPos = 0; mwPos < nbMiddleware; ++mwPos) {
      group.use(PassThrough());
    }
    for (const std::string& path : paths) {
      group.add(Define(path, OkHandler));
    }
    benchmark::DoNotOptimize(group.compose().data());
  }
  st.SetItemsProcessed(st.iterations() * st.range(0));
}

BENCHMARK(BM_ComposeFlatGroup)->Args({16, 0})->Args({16, 4})->Args({256, 4})->Args({256, 16});

void BM_ComposeNestedGroups(benchmark::State& st) {
  const auto depth = st.range(0);
  for (auto _ : st) {
    Group current;
    current.use(PassThrough()).add(Define("/leaf", OkHandler));
    for (int64_t level = 0; level < depth; ++level) {
      Group parent;
      parent.use(PassThrough()).add(Define("/level/" + std::to_string(level), OkHandler), std::move(current));
      current = std::move(parent);
    }
    benchmark::DoNotOptimize(current.compose().data());
  }
}

BENCHMARK(BM_ComposeNestedGroups)->Arg(1)->Arg(8)->Arg(32);

void BM_CallWrappedHandler(benchmark::State& st) {
  Group group;
  for (int64_t mwPos = 0; mwPos < st.range(0); ++mwPos) {
    group.use(PassThrough());
  }
  group.add(Define("/x", OkHandler));
  const HandlerUnit& unit = group.compose()[0];
  const HttpRequest req("/x");
  for (auto _ : st) {
    auto resp = unit(req);
    benchmark::DoNotOptimize(resp);
  }
}

BENCHMARK(BM_CallWrappedHandler)->Arg(0)->Arg(1)->Arg(8);

}  // namespace routegroup

BENCHMARK_MAIN();
