/**
 * @file sync_project.cpp
 * @brief Command-line project sync against a SpeleoDB instance
 *
 * This example demonstrates:
 * - Building a client from environment configuration
 * - Password and OAuth token login
 * - Listing projects with their lock holders
 * - Pulling an archive, and pushing one under the project lock
 */

#include <cavesync/remote_project/remote_project.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace cavesync::remote_project;

namespace {

void print_usage(const char* program) {
    std::cout << "Sync Project Example - Remote Project Client" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <command> [args]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  list                    List projects visible to the user" << std::endl;
    std::cout << "  pull <project_id>       Download the latest archive" << std::endl;
    std::cout << "  push <project_id> <msg> Lock, upload the local archive, release" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --host <host>           Instance host (default: www.speleoDB.org)" << std::endl;
    std::cout << "  --email <email>         Account email" << std::endl;
    std::cout << "  --password <password>   Account password" << std::endl;
    std::cout << "  --token <token>         OAuth token instead of email/password" << std::endl;
    std::cout << "  --root <dir>            Archive directory (default: ~/.ariane)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Environment: CAVESYNC_INSTANCE, CAVESYNC_ARCHIVE_ROOT, CAVESYNC_LOG_LEVEL"
              << std::endl;
}

void print_error(const std::string& what, const error& err) {
    std::cerr << "Error: " << what << ": " << err.message;
    if (err.http_status != 0) {
        std::cerr << " [HTTP " << err.http_status << "]";
    }
    std::cerr << std::endl;
}

auto list(remote_project_client& client) -> int {
    auto projects = client.list_projects();
    if (!projects) {
        print_error("list failed", projects.error());
        return 1;
    }

    std::cout << std::left << std::setw(38) << "ID" << std::setw(32) << "NAME"
              << std::setw(16) << "PERMISSION" << "LOCKED BY" << std::endl;
    for (const auto& p : projects.value()) {
        std::cout << std::setw(38) << p.id << std::setw(32) << p.name << std::setw(16)
                  << to_string(p.permission)
                  << (p.active_mutex ? p.active_mutex->describe_holder() : "-") << std::endl;
    }
    return 0;
}

auto pull(remote_project_client& client, const std::string& project_id) -> int {
    auto path = client.download(project_id);
    if (!path) {
        print_error("pull failed", path.error());
        return 1;
    }
    auto digest = checksum::sha256_file(path.value());
    std::cout << "Saved " << path.value().string();
    if (digest) {
        std::cout << " (sha256 " << digest.value() << ")";
    }
    std::cout << std::endl;
    return 0;
}

auto push(remote_project_client& client, const std::string& project_id,
          const std::string& message) -> int {
    auto locked = client.acquire_or_refresh(project_id);
    if (!locked) {
        print_error("lock failed", locked.error());
        return 1;
    }
    if (!locked.value()) {
        std::cerr << "Project " << project_id << " is locked by another user" << std::endl;
        return 2;
    }

    int status = 0;
    if (auto uploaded = client.upload(message, project_id); !uploaded) {
        print_error("push failed", uploaded.error());
        status = 1;
    } else {
        std::cout << "Uploaded " << client.archive_path(project_id).string() << std::endl;
    }

    if (auto released = client.release(project_id); !released) {
        print_error("release failed", released.error());
        status = 1;
    }
    return status;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = client_config::from_environment();
    std::string host = config.default_instance.value_or("www.speleoDB.org");
    std::string email;
    std::string password;
    std::string oauth_token;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* option) -> std::string {
            if (++i >= argc) {
                std::cerr << "Error: " << option << " requires an argument" << std::endl;
                std::exit(1);
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--host") {
            host = next("--host");
        } else if (arg == "--email") {
            email = next("--email");
        } else if (arg == "--password") {
            password = next("--password");
        } else if (arg == "--token") {
            oauth_token = next("--token");
        } else if (arg == "--root") {
            config.archive_root = next("--root");
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto client = remote_project_client::builder().with_config(config).build();
    if (!client) {
        print_error("invalid configuration", client.error());
        return 1;
    }
    auto& c = client.value();

    auto creds = oauth_token.empty() ? credentials::from_password(email, password)
                                     : credentials::from_oauth(oauth_token);
    if (auto auth = c.authenticate(creds, host); !auth) {
        print_error("login failed", auth.error());
        return 1;
    }

    const auto& command = positional[0];
    int status = 1;
    if (command == "list") {
        status = list(c);
    } else if (command == "pull" && positional.size() == 2) {
        status = pull(c, positional[1]);
    } else if (command == "push" && positional.size() == 3) {
        status = push(c, positional[1], positional[2]);
    } else {
        print_usage(argv[0]);
    }

    c.logout();
    return status;
}
