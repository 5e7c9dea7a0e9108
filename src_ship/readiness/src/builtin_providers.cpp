#include "shipkit/builtin_providers.hpp"
#include "shipkit/framework.hpp"
#include "shipkit/project_files.hpp"
#include "shipkit/scoring.hpp"

#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace {

using shipkit::readiness::ChecklistItem;
using shipkit::readiness::CheckStatus;

struct ItemTemplate {
    const char* id;
    const char* name;
    bool required;
    bool automated;
};

ChecklistItem make_item(const ItemTemplate& tmpl,
                        CheckStatus status,
                        std::string message,
                        std::optional<std::string> fix = std::nullopt) {
    ChecklistItem item;
    item.id = tmpl.id;
    item.name = tmpl.name;
    item.status = status;
    item.required = tmpl.required;
    item.message = std::move(message);
    item.fix = std::move(fix);
    item.automated = tmpl.automated;
    return item;
}

/// Pass when `ok`, otherwise `otherwise` with the remediation hint attached.
ChecklistItem presence_item(const ItemTemplate& tmpl,
                            bool ok,
                            CheckStatus otherwise,
                            std::string found,
                            std::string missing,
                            const char* fix = nullptr) {
    if (ok) {
        return make_item(tmpl, CheckStatus::pass, std::move(found));
    }
    return make_item(tmpl, otherwise, std::move(missing),
                     fix ? std::optional<std::string>{fix} : std::nullopt);
}

ChecklistItem manual_item(const ItemTemplate& tmpl, std::string message) {
    return make_item(tmpl, CheckStatus::skip, std::move(message));
}

}  // namespace

namespace shipkit::readiness {

ChecklistSection check_assets(const fs::path& project_root) {
    const ProjectFiles files(project_root);
    std::vector<ChecklistItem> items;

    const bool favicon = files.exists("public/favicon.ico");
    items.push_back(presence_item({"favicon", "Favicon generated", true, true}, favicon, CheckStatus::fail,
                                  "favicon.ico found", "No favicon.ico", "Run /ship-assets"));

    const auto og_images = files.count("public", "*og-image*.{png,jpg}");
    items.push_back(presence_item({"og-images", "Open Graph images created", true, true}, og_images > 0,
                                  CheckStatus::fail, std::to_string(og_images) + " OG images found",
                                  "No OG images", "Run /ship-assets"));

    const auto twitter_images = files.count("public", "*twitter*.{png,jpg}");
    items.push_back(presence_item({"twitter-cards", "Twitter cards configured", false, true},
                                  twitter_images > 0, CheckStatus::warning, "Twitter images found",
                                  "No Twitter card images"));

    const auto pwa_icons = files.count("public", "android-chrome-*.png");
    items.push_back(presence_item({"pwa-icons", "PWA icons ready", false, true}, pwa_icons >= 2,
                                  CheckStatus::warning, std::to_string(pwa_icons) + " PWA icons found",
                                  "Missing PWA icons"));

    const bool manifest = files.exists("public/manifest.json");
    items.push_back(presence_item({"manifest", "Manifest.json exists", false, true}, manifest,
                                  CheckStatus::warning, "manifest.json found", "No manifest.json"));

    return make_section("Assets & Branding", std::move(items), true);
}

ChecklistSection check_seo(const fs::path& project_root) {
    const ProjectFiles files(project_root);
    const auto detection = detect_framework(project_root);
    std::vector<ChecklistItem> items;

    const bool sitemap = detection.framework == Framework::next_app
                             ? files.any_exists({"app/sitemap.ts", "app/sitemap.js"})
                             : files.exists("public/sitemap.xml");
    items.push_back(presence_item({"sitemap", "Sitemap generated", true, true}, sitemap, CheckStatus::fail,
                                  "Sitemap found", "No sitemap", "Run /ship-seo"));

    const bool robots = files.exists("public/robots.txt");
    items.push_back(presence_item({"robots", "Robots.txt created", true, true}, robots, CheckStatus::fail,
                                  "robots.txt found", "No robots.txt", "Run /ship-seo"));

    const bool meta_tags = detection.framework == Framework::next_app &&
                           files.contains_all("app/layout.tsx", {"metadata", "description"});
    items.push_back(presence_item({"meta-tags", "Meta tags complete", true, true}, meta_tags,
                                  CheckStatus::warning, "Meta tags configured", "Meta tags may be incomplete",
                                  "Run /ship-seo"));

    items.push_back(manual_item({"structured-data", "Structured data added", false, false},
                                "Manual verification needed"));
    items.push_back(manual_item({"search-console", "Google Search Console setup", false, false},
                                "Manual setup required"));

    return make_section("SEO Optimization", std::move(items), true);
}

ChecklistSection check_performance(const fs::path& project_root) {
    const ProjectFiles files(project_root);
    std::vector<ChecklistItem> items;

    const bool build = files.any_exists({".next", "dist", "build"});
    items.push_back(presence_item({"build-output", "Production build exists", true, false}, build,
                                  CheckStatus::warning, "Build output found", "No build output",
                                  "Run: npm run build"));

    const auto webp = files.count("public", "*.webp", true);
    items.push_back(presence_item({"optimized-images", "Images optimized", false, true}, webp > 0,
                                  CheckStatus::warning, std::to_string(webp) + " WebP images found",
                                  "No optimized images", "Run /ship-perf"));

    const auto detection = detect_framework(project_root);
    if (detection.is_next()) {
        const bool optimized = files.contains_all("next.config.js", {"swcMinify", "compress"});
        items.push_back(presence_item({"config-optimized", "Framework config optimized", false, true},
                                      optimized, CheckStatus::warning, "Config optimized",
                                      "Config not optimized", "Run /ship-perf"));
    }

    items.push_back(manual_item({"lighthouse-score", "Lighthouse score > 90", false, true},
                                "Run /ship-perf to check"));
    items.push_back(manual_item({"core-web-vitals", "Core Web Vitals good", false, true},
                                "Run /ship-perf to check"));

    return make_section("Performance", std::move(items), true);
}

ChecklistSection check_security(const fs::path& project_root) {
    const ProjectFiles files(project_root);
    std::vector<ChecklistItem> items;

    const bool env_ignored = files.contains_all(".gitignore", {".env"});
    items.push_back(presence_item({"env-gitignore", "Environment variables not exposed", true, false},
                                  env_ignored, CheckStatus::warning, ".env is gitignored",
                                  ".env may not be gitignored"));

    const auto detection = detect_framework(project_root);
    const bool headers = detection.is_next() && files.contains_all("next.config.js", {"headers()"});
    items.push_back(presence_item({"security-headers", "Security headers set", false, true}, headers,
                                  CheckStatus::warning, "Headers configured", "No security headers"));

    items.push_back(manual_item({"dependencies", "Dependencies up to date", false, false}, "Run: npm audit"));
    items.push_back(manual_item({"no-secrets", "No API keys in client code", true, false},
                                "Manual verification needed"));
    items.push_back(manual_item({"https", "HTTPS enabled", true, false}, "Verify after deployment"));

    return make_section("Security", std::move(items), true);
}

ChecklistSection check_functionality(const fs::path& project_root) {
    const ProjectFiles files(project_root);
    const auto detection = detect_framework(project_root);
    std::vector<ChecklistItem> items;

    bool has_404 = false;
    if (detection.framework == Framework::next_app) {
        has_404 = files.any_exists({"app/not-found.tsx", "app/not-found.jsx"});
    } else if (detection.framework == Framework::next_pages) {
        has_404 = files.any_exists({"pages/404.tsx", "pages/404.jsx"});
    }
    items.push_back(presence_item({"404-page", "404 page exists", false, false}, has_404,
                                  CheckStatus::warning, "404 page found", "No custom 404 page"));

    items.push_back(manual_item({"error-handling", "Error handling in place", false, false},
                                "Manual verification needed"));
    items.push_back(manual_item({"forms", "Forms working correctly", false, false}, "Manual testing required"));
    items.push_back(manual_item({"links", "Links not broken", false, false}, "Manual verification needed"));
    items.push_back(manual_item({"mobile-responsive", "Mobile responsive", false, false},
                                "Manual testing required"));

    return make_section("Functionality", std::move(items), false);
}

ChecklistSection check_analytics(const fs::path&) {
    std::vector<ChecklistItem> items;
    items.push_back(manual_item({"analytics", "Analytics installed", false, false},
                                "Manual setup (Google Analytics, Vercel Analytics, etc.)"));
    items.push_back(manual_item({"error-tracking", "Error tracking setup", false, false},
                                "Manual setup (Sentry, LogRocket, etc.)"));
    items.push_back(manual_item({"performance-monitoring", "Performance monitoring", false, false},
                                "Manual setup"));
    return make_section("Analytics & Monitoring", std::move(items), false);
}

ChecklistSection check_documentation(const fs::path& project_root) {
    const ProjectFiles files(project_root);
    std::vector<ChecklistItem> items;

    items.push_back(presence_item({"readme", "README.md complete", false, false}, files.exists("README.md"),
                                  CheckStatus::warning, "README.md found", "No README.md"));
    items.push_back(presence_item({"changelog", "Changelog started", false, false},
                                  files.exists("CHANGELOG.md"), CheckStatus::skip, "CHANGELOG.md found",
                                  "No CHANGELOG.md"));
    items.push_back(manual_item({"api-docs", "API docs (if applicable)", false, false},
                                "Only if you have an API"));

    return make_section("Documentation", std::move(items), false);
}

ChecklistSection check_legal(const fs::path&) {
    std::vector<ChecklistItem> items;
    items.push_back(manual_item({"privacy-policy", "Privacy policy (if needed)", false, false},
                                "Required if collecting user data"));
    items.push_back(manual_item({"terms", "Terms of service (if needed)", false, false},
                                "Required for commercial apps"));
    items.push_back(manual_item({"cookies", "Cookie consent (if needed)", false, false},
                                "Required for GDPR compliance"));
    return make_section("Legal & Compliance", std::move(items), false);
}

std::vector<NamedProvider> default_providers() {
    return {
        {"Assets & Branding", true, check_assets},
        {"SEO Optimization", true, check_seo},
        {"Performance", true, check_performance},
        {"Security", true, check_security},
        {"Functionality", false, check_functionality},
        {"Analytics & Monitoring", false, check_analytics},
        {"Documentation", false, check_documentation},
        {"Legal & Compliance", false, check_legal},
    };
}

}  // namespace shipkit::readiness
