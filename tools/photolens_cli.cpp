#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "photolens/config.hpp"
#include "photolens/core/log.hpp"
#include "photolens/photo_search.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct Args {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> aspect;
    std::optional<std::string> prompt;
    std::optional<std::size_t> workers;
    std::size_t k{photolens::query::kDefaultTopK};
    bool skip_existing{false};
    bool verbose{false};
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static std::optional<std::size_t> parse_count(const std::string& s) {
    std::size_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
    return v;
}

static void print_usage() {
    std::cout << "photolens: semantic photo search\n"
              << "Usage: photolens <command> [args] [--db=DIR] [--model=M] [--embed-model=M]\n"
              << "                 [--host=URL] [--log-level=LEVEL]\n"
              << "Commands:\n"
              << "  index <dir>        [--aspect=A] [--prompt=P] [--workers=N] [--skip-existing]\n"
              << "  add <photo>        [--aspect=A] [--prompt=P]\n"
              << "  search <image>     [--aspect=A] [--k=N] [--verbose]\n"
              << "  search-text <text> [--aspect=A] [--k=N] [--verbose]\n"
              << "  show <photo>\n"
              << "  delete <photo>     [--aspect=A]\n"
              << "  list | clear | compact | models\n";
}

static int fail(const photolens::core::error& e) {
    std::cerr << "error: " << photolens::core::describe(e) << "\n";
    return kExitFailed;
}

static void print_results(const std::vector<photolens::index::search_result>& hits, bool verbose) {
    if (hits.empty()) {
        std::cout << "No matches.\n";
        return;
    }
    int rank = 1;
    for (const auto& h : hits) {
        std::cout << rank++ << ". " << h.photo_path << " [" << h.aspect_name << "] distance=" << h.distance << "\n";
        if (verbose) std::cout << "   " << h.description << "\n";
    }
}

static int run(photolens::photo_search& ps, const Args& args) {
    const auto& cmd = args.command;
    const auto& pos = args.positional;
    auto need = [&](std::size_t n) {
        if (pos.size() == n) return true;
        std::cerr << "error: '" << cmd << "' expects " << n << " argument(s)\n";
        return false;
    };
    const std::optional<std::string_view> aspect =
        args.aspect ? std::optional<std::string_view>(*args.aspect) : std::nullopt;
    const std::optional<std::string_view> prompt =
        args.prompt ? std::optional<std::string_view>(*args.prompt) : std::nullopt;

    if (cmd == "index") {
        if (!need(1)) return kExitUsage;
        photolens::pipeline::indexing_request req;
        req.root = pos[0];
        if (args.aspect) req.aspect = *args.aspect;
        req.prompt = args.prompt;
        req.concurrency = args.workers.value_or(0);
        req.skip_existing = args.skip_existing;
        auto report = ps.run_indexing(req, [](const photolens::pipeline::item_result& r, std::size_t, std::size_t) {
            if (r.outcome == photolens::pipeline::item_outcome::failed) {
                std::cout << "Error processing " << r.photo_path << ": " << photolens::core::describe(*r.error) << "\n";
            }
        });
        if (!report) return fail(report.error());
        std::cout << "Indexed " << report->succeeded << " of " << report->total << " photos (" << report->skipped
                  << " skipped, " << report->failed << " errors)\n";
        return report->failed == 0 ? kExitOk : kExitFailed;
    }
    if (cmd == "add") {
        if (!need(1)) return kExitUsage;
        const std::string a = args.aspect.value_or(photolens::kDefaultAspect);
        if (auto r = ps.add_photo(pos[0], a, prompt); !r) return fail(r.error());
        std::cout << "Added " << photolens::pipeline::photo_key(pos[0]) << " [" << a << "]\n";
        return kExitOk;
    }
    if (cmd == "search" || cmd == "search-text") {
        if (!need(1)) return kExitUsage;
        auto hits = cmd == "search" ? ps.search_by_image(fs::path(pos[0]), aspect, args.k)
                                    : ps.search_by_text(pos[0], aspect, args.k);
        if (!hits) return fail(hits.error());
        print_results(*hits, args.verbose);
        return kExitOk;
    }
    if (cmd == "show") {
        if (!need(1)) return kExitUsage;
        const auto path = photolens::pipeline::photo_key(pos[0]);
        auto aspects = ps.describe_photo(path);
        if (!aspects) return fail(aspects.error());
        if (aspects->empty()) {
            std::cout << path << " is not indexed.\n";
            return kExitFailed;
        }
        std::cout << path << "\n";
        for (const auto& a : *aspects) std::cout << "  [" << a.aspect_name << "] " << a.description << "\n";
        return kExitOk;
    }
    if (cmd == "delete") {
        if (!need(1)) return kExitUsage;
        auto n = ps.remove(pos[0], aspect);
        if (!n) return fail(n.error());
        std::cout << "Deleted " << *n << " record(s)\n";
        return kExitOk;
    }
    if (cmd == "list") {
        if (!need(0)) return kExitUsage;
        auto paths = ps.list_photo_paths();
        if (!paths) return fail(paths.error());
        for (const auto& p : *paths) std::cout << p << "\n";
        return kExitOk;
    }
    if (cmd == "clear") {
        if (!need(0)) return kExitUsage;
        if (auto r = ps.clear(); !r) return fail(r.error());
        std::cout << "Store cleared\n";
        return kExitOk;
    }
    if (cmd == "compact") {
        if (!need(0)) return kExitUsage;
        if (auto r = ps.compact(); !r) return fail(r.error());
        std::cout << "Store compacted\n";
        return kExitOk;
    }
    if (cmd == "models") {
        if (!need(0)) return kExitUsage;
        auto models = ps.list_available_models();
        if (!models) return fail(models.error());
        for (const auto& m : *models) std::cout << m << "\n";
        return kExitOk;
    }
    std::cerr << "error: unknown command '" << cmd << "'\n";
    print_usage();
    return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
    auto cfg = photolens::load_config_from_env();
    if (!cfg) return fail(cfg.error());

    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return kExitOk; }
        else if (auto v = eat(a, "--db=")) cfg->store_dir = *v;
        else if (auto v = eat(a, "--model=")) cfg->model = *v;
        else if (auto v = eat(a, "--embed-model=")) cfg->embedding_model = *v;
        else if (auto v = eat(a, "--host=")) cfg->endpoint = *v;
        else if (auto v = eat(a, "--log-level=")) cfg->log_level = *v;
        else if (auto v = eat(a, "--aspect=")) args.aspect = *v;
        else if (auto v = eat(a, "--prompt=")) args.prompt = *v;
        else if (auto v = eat(a, "--workers=")) {
            args.workers = parse_count(*v);
            if (!args.workers || *args.workers == 0) { std::cerr << "error: bad --workers value\n"; return kExitUsage; }
        }
        else if (auto v = eat(a, "--k=")) {
            auto k = parse_count(*v);
            if (!k) { std::cerr << "error: bad --k value\n"; return kExitUsage; }
            args.k = *k;
        }
        else if (a == "--skip-existing") args.skip_existing = true;
        else if (a == "--verbose" || a == "-v") args.verbose = true;
        else if (a.rfind("--", 0) == 0) { std::cerr << "error: unknown option " << a << "\n"; return kExitUsage; }
        else if (args.command.empty()) args.command = a;
        else args.positional.push_back(a);
    }
    if (args.command.empty()) { print_usage(); return kExitUsage; }

    auto level = photolens::core::parse_log_level(cfg->log_level);
    if (!level) return fail(level.error());
    photolens::core::set_log_level(*level);

    auto ps = photolens::photo_search::open(*cfg);
    if (!ps) return fail(ps.error());
    return run(*ps, args);
}
