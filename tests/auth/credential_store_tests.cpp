#include <catch2/catch_test_macros.hpp>
#include "scrape_core/auth/CredentialCipher.h"
#include "scrape_core/auth/CredentialStore.h"
#include "scrape_core/common/Errors.h"

#include <atomic>
#include <fstream>
#include <random>
#include <sstream>

using namespace scrape_core::auth;
using scrape_core::common::ConfigurationError;
using scrape_core::common::CredentialUnavailableError;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("scrape_core_test_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

class ScriptedPrompt : public CredentialPrompt {
public:
    explicit ScriptedPrompt(std::optional<Credentials> answer) : answer_(std::move(answer)) {}

    std::optional<Credentials> prompt(const std::string&) override {
        ++calls;
        return answer_;
    }

    std::atomic<int> calls{0};

private:
    std::optional<Credentials> answer_;
};

const std::string kMachine = "0123456789abcdef-test-machine";

struct StoreFixture {
    TempDir dir;
    std::shared_ptr<FileSecretStore> secrets = std::make_shared<FileSecretStore>(dir.path() / "secrets.json");

    CredentialStoreOptions options(bool allowPrompt = false) const {
        CredentialStoreOptions opts;
        opts.configDir = dir.path() / "config";
        opts.machineId = kMachine;
        opts.allowPrompt = allowPrompt;
        return opts;
    }

    void writeConfig(const json& content) const {
        fs::create_directories(dir.path() / "config");
        std::ofstream(dir.path() / "config" / "credentials.json") << content.dump();
    }
};

} // namespace

TEST_CASE("CredentialCipher seals and opens payloads", "[CredentialCipher]") {
    CredentialCipher cipher("example.com", kMachine);

    SECTION("Sealed payloads open with the same key") {
        std::string blob = cipher.seal("{\"username\":\"jo\"}");
        REQUIRE(blob != "{\"username\":\"jo\"}");
        REQUIRE(cipher.open(blob) == std::optional<std::string>("{\"username\":\"jo\"}"));

        // fresh IV per seal
        REQUIRE(cipher.seal("same") != cipher.seal("same"));
    }

    SECTION("A different credential key or machine cannot open the blob") {
        std::string blob = cipher.seal("secret");
        REQUIRE_FALSE(CredentialCipher("other.com", kMachine).open(blob).has_value());
        REQUIRE_FALSE(CredentialCipher("example.com", "another-machine").open(blob).has_value());
    }

    SECTION("Tampered or malformed blobs are rejected") {
        std::string raw = *CredentialCipher::base64Decode(cipher.seal("secret"));
        raw.back() ^= 0x01;
        REQUIRE_FALSE(cipher.open(CredentialCipher::base64Encode(raw)).has_value());
        REQUIRE_FALSE(cipher.open("not base64 at all!").has_value());
        REQUIRE_FALSE(cipher.open(CredentialCipher::base64Encode("v1short")).has_value());
    }

    SECTION("Salt and encoding helpers") {
        REQUIRE(CredentialCipher::saltFor("abc") == "abc0000000000000");
        REQUIRE(CredentialCipher::saltFor("0123456789abcdefXYZ") == "0123456789abcdef");
        REQUIRE(CredentialCipher::base64Encode("hello") == "aGVsbG8=");
        REQUIRE(CredentialCipher::base64Decode("aGVsbG8=") == std::optional<std::string>("hello"));
        REQUIRE_FALSE(CredentialCipher::base64Decode("abc").has_value());
        REQUIRE_FALSE(CredentialCipher::machineIdentifier().empty());
    }
}

TEST_CASE("Credentials JSON form", "[Credentials]") {
    auto creds = Credentials::fromJson({{"username", "jo"}, {"password", "pw"}});
    REQUIRE(creds.username == "jo");
    REQUIRE(creds.password == "pw");
    REQUIRE_FALSE(creds.save);
    REQUIRE_FALSE(creds.toJson().contains("save"));

    REQUIRE_THROWS_AS(Credentials::fromJson({{"username", "jo"}}), ConfigurationError);
    REQUIRE_THROWS_AS(Credentials::fromJson({{"username", 1}, {"password", "pw"}}), ConfigurationError);
}

TEST_CASE("CredentialStore resolution order", "[CredentialStore]") {
    StoreFixture fx;

    SECTION("Plain config file entry") {
        fx.writeConfig({{"shop", {{"username", "jo"}, {"password", "pw"}}}});
        CredentialStore store(fx.options(), fx.secrets);
        auto creds = store.resolve("shop");
        REQUIRE(creds.username == "jo");
        REQUIRE(creds.password == "pw");
    }

    SECTION("Secret store wins over the config file") {
        fx.writeConfig({{"shop", {{"username", "from-file"}, {"password", "pw"}}}});
        CredentialStore writer(fx.options(), fx.secrets);
        REQUIRE(writer.persist("shop", {"from-vault", "vpw"}, true));

        CredentialStore reader(fx.options(), fx.secrets);
        REQUIRE(reader.resolve("shop").username == "from-vault");
    }

    SECTION("Undecryptable secret falls through to the config file") {
        fx.secrets->put(CredentialStore::kService, "shop", "garbage");
        fx.writeConfig({{"shop", {{"username", "jo"}, {"password", "pw"}}}});
        CredentialStore store(fx.options(), fx.secrets);
        REQUIRE(store.resolve("shop").username == "jo");
    }

    SECTION("Corrupt config entries are skipped") {
        fx.writeConfig({
            {"broken", {{"username", "jo"}}},
            {"sealed", {{"encrypted", "AAAA"}}}
        });
        CredentialStore store(fx.options(), fx.secrets);
        REQUIRE_THROWS_AS(store.resolve("broken"), CredentialUnavailableError);
        REQUIRE_THROWS_AS(store.resolve("sealed"), CredentialUnavailableError);
    }

    SECTION("Malformed config file is treated as empty") {
        fs::create_directories(fx.dir.path() / "config");
        std::ofstream(fx.dir.path() / "config" / "credentials.json") << "{ not json";
        CredentialStore store(fx.options(), fx.secrets);
        REQUIRE_THROWS_AS(store.resolve("shop"), CredentialUnavailableError);
    }

    SECTION("No source and no prompt") {
        CredentialStore store(fx.options(), fx.secrets);
        try {
            store.resolve("nowhere");
            FAIL("expected CredentialUnavailableError");
        } catch (const CredentialUnavailableError& e) {
            REQUIRE(e.key() == "nowhere");
        }
    }
}

TEST_CASE("CredentialStore persistence", "[CredentialStore]") {
    StoreFixture fx;

    SECTION("Secure persist survives a fresh store and stays private") {
        {
            CredentialStore store(fx.options(), fx.secrets);
            REQUIRE(store.persist("shop", {"jo", "p@ss word"}, true));
        }
        auto perms = fs::status(fx.secrets->path()).permissions();
        REQUIRE((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);

        std::ifstream raw(fx.secrets->path());
        std::stringstream content;
        content << raw.rdbuf();
        REQUIRE(content.str().find("p@ss word") == std::string::npos);

        CredentialStore fresh(fx.options(), std::make_shared<FileSecretStore>(fx.secrets->path()));
        auto creds = fresh.resolve("shop");
        REQUIRE(creds.username == "jo");
        REQUIRE(creds.password == "p@ss word");
    }

    SECTION("Insecure persist writes a sealed config entry") {
        CredentialStore store(fx.options(), fx.secrets);
        REQUIRE(store.persist("shop", {"jo", "pw"}, false));

        std::ifstream file(store.configFile());
        json config = json::parse(file);
        REQUIRE(config["shop"].contains("encrypted"));
        REQUIRE_FALSE(config["shop"].contains("password"));
        REQUIRE_FALSE(fx.secrets->get(CredentialStore::kService, "shop").has_value());

        CredentialStore fresh(fx.options(), fx.secrets);
        REQUIRE(fresh.resolve("shop").password == "pw");
    }

    SECTION("Other config entries are kept") {
        fx.writeConfig({{"other", {{"username", "a"}, {"password", "b"}}}});
        CredentialStore store(fx.options(), fx.secrets);
        REQUIRE(store.persist("shop", {"jo", "pw"}, false));
        REQUIRE(store.resolve("other").username == "a");
    }

    SECTION("Forget drops the cached copy") {
        fx.writeConfig({{"shop", {{"username", "old"}, {"password", "pw"}}}});
        CredentialStore store(fx.options(), fx.secrets);
        REQUIRE(store.resolve("shop").username == "old");

        fx.writeConfig({{"shop", {{"username", "new"}, {"password", "pw"}}}});
        REQUIRE(store.resolve("shop").username == "old");
        store.forget("shop");
        REQUIRE(store.resolve("shop").username == "new");
    }

    SECTION("A corrupt secret store file is left untouched") {
        fs::create_directories(fx.secrets->path().parent_path());
        const std::string corrupt = "{\"scrape_core\": {\"other\": \"blob\"";
        std::ofstream(fx.secrets->path()) << corrupt;

        CredentialStore store(fx.options(), fx.secrets);
        REQUIRE_FALSE(fx.secrets->put(CredentialStore::kService, "shop", "blob"));
        REQUIRE_FALSE(store.persist("shop", {"jo", "pw"}, true));

        std::ifstream raw(fx.secrets->path());
        std::stringstream content;
        content << raw.rdbuf();
        REQUIRE(content.str() == corrupt);
    }

    SECTION("Secret store removal") {
        REQUIRE(fx.secrets->put(CredentialStore::kService, "shop", "blob"));
        REQUIRE(fx.secrets->remove(CredentialStore::kService, "shop"));
        REQUIRE_FALSE(fx.secrets->remove(CredentialStore::kService, "shop"));
        REQUIRE_FALSE(fx.secrets->get(CredentialStore::kService, "shop").has_value());
    }
}

TEST_CASE("CredentialStore prompting", "[CredentialStore]") {
    StoreFixture fx;

    SECTION("Prompted credentials are cached and saved when asked") {
        Credentials answer{"jo", "pw", true};
        auto prompt = std::make_shared<ScriptedPrompt>(answer);
        CredentialStore store(fx.options(true), fx.secrets, prompt);

        auto creds = store.resolve("shop");
        REQUIRE(creds.username == "jo");
        REQUIRE_FALSE(creds.save);
        store.resolve("shop");
        REQUIRE(prompt->calls == 1);

        CredentialStore fresh(fx.options(false), fx.secrets);
        REQUIRE(fresh.resolve("shop").password == "pw");
    }

    SECTION("Prompted credentials are not saved unless asked") {
        auto prompt = std::make_shared<ScriptedPrompt>(Credentials{"jo", "pw", false});
        CredentialStore store(fx.options(true), fx.secrets, prompt);
        store.resolve("shop");

        CredentialStore fresh(fx.options(false), fx.secrets);
        REQUIRE_THROWS_AS(fresh.resolve("shop"), CredentialUnavailableError);
    }

    SECTION("Non-secure storage saves prompted credentials to the config file") {
        auto opts = fx.options(true);
        opts.secure = false;
        auto prompt = std::make_shared<ScriptedPrompt>(Credentials{"jo", "pw", true});
        CredentialStore store(opts, fx.secrets, prompt);
        store.resolve("shop");
        REQUIRE(fs::exists(store.configFile()));
        REQUIRE_FALSE(fx.secrets->get(CredentialStore::kService, "shop").has_value());
    }

    SECTION("A declined prompt leaves the key unavailable") {
        auto prompt = std::make_shared<ScriptedPrompt>(std::nullopt);
        CredentialStore store(fx.options(true), fx.secrets, prompt);
        REQUIRE_THROWS_AS(store.resolve("shop"), CredentialUnavailableError);
    }

    SECTION("Prompt is skipped when prompting is disabled") {
        auto prompt = std::make_shared<ScriptedPrompt>(Credentials{"jo", "pw", false});
        CredentialStore store(fx.options(false), fx.secrets, prompt);
        REQUIRE_THROWS_AS(store.resolve("shop"), CredentialUnavailableError);
        REQUIRE(prompt->calls == 0);
    }
}

TEST_CASE("Terminal prompt reads from its streams", "[CredentialPrompt]") {
    SECTION("Full answer with save") {
        std::istringstream in("jo@example.com\nhunter2\nYes\n");
        std::ostringstream out;
        TerminalCredentialPrompt prompt(in, out);

        auto creds = prompt.prompt("shop");
        REQUIRE(creds.has_value());
        REQUIRE(creds->username == "jo@example.com");
        REQUIRE(creds->password == "hunter2");
        REQUIRE(creds->save);
        REQUIRE(out.str().find("Please enter credentials for shop") != std::string::npos);
        REQUIRE(out.str().find("Save credentials for future use? (y/n)") != std::string::npos);
    }

    SECTION("Closed input yields nothing") {
        std::istringstream in("");
        std::ostringstream out;
        TerminalCredentialPrompt prompt(in, out);
        REQUIRE_FALSE(prompt.prompt("shop").has_value());
    }
}

TEST_CASE("CredentialStore options from JSON", "[CredentialStore]") {
    auto options = CredentialStoreOptions::fromJson({
        {"config_dir", "/tmp/creds"},
        {"secure_storage", false},
        {"allow_prompt", false}
    });
    REQUIRE(options.configDir == fs::path("/tmp/creds"));
    REQUIRE_FALSE(options.secure);
    REQUIRE_FALSE(options.allowPrompt);
    REQUIRE_THROWS_AS(CredentialStoreOptions::fromJson({{"secure_storage", "yes"}}), ConfigurationError);
    REQUIRE(CredentialStoreOptions::defaultConfigDir().filename() == ".scraper");
}
