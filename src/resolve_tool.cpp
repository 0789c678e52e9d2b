// vidgate-resolve: Command-line access to the gateway's resolution logic.
//
// Accepts the same backend and resolution flags as the daemon and runs one
// operation against the configured object store.
//
// Usage: vidgate-resolve [options] <subcommand> [args]
//
// Subcommands:
//   id <email>                   Identifier for an email address
//   resolve <identifier>         Resolve JSON, as served by /sample
//   head <key>                   Object metadata
//   list <prefix> [--limit N]    Keys under a prefix
//   presign <key>                Presigned GET URL

#include "vidgate/gateway_config.hpp"
#include "vidgate/log.hpp"
#include "vidgate/net/http.hpp"
#include "vidgate/pointer_resolver.hpp"
#include "vidgate/storage/backend.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

namespace {

void print_usage() {
    fprintf(stderr,
        "Usage: vidgate-resolve [options] <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  id <email>                    Identifier for an email address\n"
        "  resolve <identifier>          Resolve JSON, as served by /sample\n"
        "  head <key>                    Object metadata\n"
        "  list <prefix>                 Keys under a prefix\n"
        "  presign <key>                 Presigned GET URL (s3 only)\n"
        "\n"
        "Options:\n"
        "  --limit <N>                   Max keys for list (default: all)\n"
        "  --help                        Show this help\n"
        "\n"
        "Backend and resolution options are the same as for vidgate:\n"
        "\n");
    fputs(vidgate::GatewayConfig::usage(), stderr);
}

int cmd_resolve(const vidgate::StorageBackend& backend, const vidgate::GatewayConfig& config,
                const std::string& identifier) {
    vidgate::ResolverOptions options;
    options.public_base = config.public_base;
    options.mode = config.delivery_mode;
    options.presign_expiry = config.presign_expiry;
    options.pointer_prefix = config.pointer_prefix;

    vidgate::PointerResolver resolver(backend, options);
    auto result = resolver.resolve(identifier, "");
    printf("%s\n", result.to_json().dump(2).c_str());
    return result.ok() ? 0 : 2;
}

int cmd_head(const vidgate::StorageBackend& backend, const std::string& key) {
    auto meta = backend.head(key);
    if (!meta) {
        fprintf(stderr, "Not found: %s\n", key.c_str());
        return 2;
    }

    printf("key:           %s\n", key.c_str());
    printf("size:          %" PRIu64 "\n", meta->size);
    printf("content-type:  %s\n", meta->content_type.empty() ? "-" : meta->content_type.c_str());
    printf("etag:          %s\n", meta->etag.empty() ? "-" : meta->etag.c_str());
    if (meta->last_modified.time_since_epoch().count() != 0) {
        printf("last-modified: %s\n", vidgate::net::format_http_date(meta->last_modified).c_str());
    }
    for (const auto& [name, value] : meta->user_metadata) {
        printf("meta-%s: %s\n", name.c_str(), value.c_str());
    }
    return 0;
}

int cmd_list(const vidgate::StorageBackend& backend, const std::string& prefix, uint64_t limit) {
    vidgate::ListOptions options;
    options.prefix = prefix;

    uint64_t count = 0;
    while (true) {
        if (limit > 0 && limit - count < options.max_keys) {
            options.max_keys = static_cast<uint32_t>(limit - count);
        }
        auto page = backend.list(options);
        if (!page.success) {
            fprintf(stderr, "List failed: %s\n", page.error_message.c_str());
            return 1;
        }
        for (const auto& entry : page.entries) {
            if (entry.is_directory) {
                printf("-\t%s\n", entry.key.c_str());
            } else {
                printf("%" PRIu64 "\t%s\n", entry.size, entry.key.c_str());
            }
            ++count;
        }
        if (!page.truncated || page.continuation_token.empty()) break;
        if (limit > 0 && count >= limit) break;
        options.continuation_token = page.continuation_token;
    }

    fprintf(stderr, "%" PRIu64 " key(s)\n", count);
    return 0;
}

int cmd_presign(const vidgate::StorageBackend& backend, const vidgate::GatewayConfig& config,
                const std::string& key) {
    auto url = backend.presign_url(key, config.presign_expiry);
    if (!url) {
        fprintf(stderr, "The %s backend cannot presign URLs\n", backend.type_name().c_str());
        return 1;
    }
    printf("%s\n", url->c_str());
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    vidgate::GatewayConfig config;
    std::string subcommand;
    std::string operand;
    uint64_t limit = 0;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--limit") {
            if (++i >= argc) { fprintf(stderr, "--limit requires argument\n"); return 1; }
            limit = strtoull(argv[i], nullptr, 10);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg[0] != '-' && subcommand.empty()) {
            subcommand = arg;
        } else if (arg[0] != '-' && operand.empty()) {
            operand = arg;
        } else if (!config.parse_option(argc, argv, i)) {
            print_usage();
            return 1;
        }
    }

    if (subcommand.empty()) {
        print_usage();
        return 1;
    }

    if (subcommand == "id") {
        if (operand.empty()) { fprintf(stderr, "id requires an email address\n"); return 1; }
        printf("%s\n", vidgate::make_identifier(operand).c_str());
        return 0;
    }

    bool needs_operand = subcommand != "list";
    if (subcommand != "resolve" && subcommand != "head" && subcommand != "list" &&
        subcommand != "presign") {
        fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
        print_usage();
        return 1;
    }
    if (needs_operand && operand.empty()) {
        fprintf(stderr, "%s requires an argument\n", subcommand.c_str());
        return 1;
    }

    config.apply_defaults();
    vidgate::set_verbose_logging(config.verbose);

    auto err = config.backend.validate();
    if (!err.empty()) {
        fprintf(stderr, "Configuration error: %s\n", err.c_str());
        return 1;
    }

    std::unique_ptr<vidgate::StorageBackend> backend;
    try {
        backend = vidgate::StorageBackendFactory::create(config.backend.type,
                                                         config.backend.params);
    } catch (const std::exception& e) {
        fprintf(stderr, "Failed to create storage backend: %s\n", e.what());
        return 1;
    }

    try {
        if (subcommand == "resolve") return cmd_resolve(*backend, config, operand);
        if (subcommand == "head") return cmd_head(*backend, operand);
        if (subcommand == "list") return cmd_list(*backend, operand, limit);
        return cmd_presign(*backend, config, operand);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
