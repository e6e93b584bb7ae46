#include <kfetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <system_error>

namespace kfetch::config {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Cut a trailing "# comment" that is not inside quotes
void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
}

std::string percent_encode_userinfo(const std::string& s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

} // namespace

std::optional<bool> parse_bool(std::string_view value) {
    std::string v = lower(value);
    trim(v);
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(std::string_view value) {
    std::string v(value);
    trim(v);
    // TOML allows 1_000_000
    v.erase(std::remove(v.begin(), v.end(), '_'), v.end());
    std::uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (v.empty() || ec != std::errc{} || ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

std::optional<double> parse_double(std::string_view value) {
    std::string v(value);
    trim(v);
    if (v.empty())
        return std::nullopt;
    try {
        std::size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size())
            return std::nullopt;
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_inline_comment(v);

        // Both "[downloader] concurrency" and "downloader.concurrency" are accepted
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("KFETCH_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "kfetch" / "config.toml";
    }

    return configHome / "kfetch" / "config.toml";
}

Settings load_settings(const std::filesystem::path& config_path) {
    Settings s;
    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        spdlog::debug("No config file at {}, using defaults", config_path.string());
        return s;
    }
    spdlog::debug("Loading config from {}", config_path.string());

    auto get = [&](const char* section, const char* key) {
        return parse_config_value(config_path, section, key);
    };
    auto warn = [&](const char* section, const char* key, const std::string& raw) {
        spdlog::warn("Ignoring invalid value '{}' for [{}] {} in {}", raw, section, key,
                     config_path.string());
    };
    auto read_bool = [&](const char* section, const char* key, bool& out) {
        auto raw = get(section, key);
        if (raw.empty())
            return;
        if (auto v = parse_bool(raw))
            out = *v;
        else
            warn(section, key, raw);
    };
    auto read_u64 = [&](const char* section, const char* key, std::uint64_t& out) {
        auto raw = get(section, key);
        if (raw.empty())
            return;
        if (auto v = parse_u64(raw))
            out = *v;
        else
            warn(section, key, raw);
    };
    auto read_size = [&](const char* section, const char* key, std::size_t& out) {
        std::uint64_t v = out;
        read_u64(section, key, v);
        out = static_cast<std::size_t>(v);
    };
    auto read_string = [&](const char* section, const char* key, std::string& out) {
        auto raw = get(section, key);
        if (!raw.empty())
            out = raw;
    };

    if (auto root = get("output", "root"); !root.empty())
        s.outputRoot = expand_tilde(root);
    read_bool("output", "save_info", s.saveInfo);

    read_size("downloader", "concurrency", s.concurrency);
    read_size("downloader", "per_host", s.perHost);
    read_u64("downloader", "timeout_ms", s.timeoutMs);
    read_u64("downloader", "transfer_deadline_ms", s.transferDeadlineMs);
    read_bool("downloader", "resume_partial", s.resumePartial);
    read_u64("downloader", "rate_limit_bps", s.rateLimitBps);
    read_u64("downloader", "per_host_bps", s.perHostBps);

    {
        std::uint64_t attempts = static_cast<std::uint64_t>(s.maxAttempts);
        read_u64("retry", "max_attempts", attempts);
        s.maxAttempts = static_cast<int>(std::clamp<std::uint64_t>(attempts, 1, 100));
    }
    read_u64("retry", "initial_backoff_ms", s.initialBackoffMs);
    if (auto raw = get("retry", "multiplier"); !raw.empty()) {
        if (auto v = parse_double(raw); v && *v >= 1.0)
            s.multiplier = *v;
        else
            warn("retry", "multiplier", raw);
    }
    read_u64("retry", "max_backoff_ms", s.maxBackoffMs);

    read_string("network", "proxy", s.proxy);
    read_string("network", "proxy_username", s.proxyUsername);
    read_string("network", "proxy_password", s.proxyPassword);
    read_bool("network", "verify_tls", s.verifyTls);
    if (auto ca = get("network", "ca_path"); !ca.empty())
        s.caPath = expand_tilde(ca).string();
    read_string("network", "user_agent", s.userAgent);

    read_string("auth", "session_token", s.sessionToken);

    read_bool("crawl", "process_from_oldest", s.processFromOldest);
    read_bool("crawl", "include_empty_posts", s.includeEmptyPosts);
    read_string("crawl", "api_base", s.apiBase);

    if (s.concurrency == 0) {
        spdlog::warn("[downloader] concurrency must be at least 1; using 1");
        s.concurrency = 1;
    }
    return s;
}

std::string build_proxy_url(const std::string& proxy, const std::string& username,
                            const std::string& password) {
    if (proxy.empty())
        return "";
    std::string scheme = "http://";
    std::string hostPart = proxy;
    if (auto pos = proxy.find("://"); pos != std::string::npos) {
        scheme = proxy.substr(0, pos + 3);
        hostPart = proxy.substr(pos + 3);
    }
    if (username.empty() || hostPart.find('@') != std::string::npos)
        return scheme + hostPart;
    std::string userinfo = percent_encode_userinfo(username);
    if (!password.empty())
        userinfo += ":" + percent_encode_userinfo(password);
    return scheme + userinfo + "@" + hostPart;
}

} // namespace kfetch::config
