#include <catch2/catch_test_macros.hpp>
#include <tether/tether.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Ui that answers prompts from queues and records what was asked.
/// An empty queue means the surface is closed.
class ScriptedUi : public tether::Ui {
public:
    std::deque<std::string>  answers;
    std::deque<std::string>  password_answers;
    std::vector<std::string> prompts;
    std::vector<std::string> password_prompts;
    std::string              written;
    tether::ProgressOutput*  progress = nullptr;
    std::atomic<int>         in_flight{0};
    std::atomic<bool>        overlapped{false};

    std::string prompt(const std::string& label) override {
        enter();
        prompts.push_back(label);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto answer = next(answers);
        leave();
        if (!answer) throw tether::PromptError("closed");
        return *answer;
    }

    std::string prompt_password(const std::string& label) override {
        enter();
        password_prompts.push_back(label);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto answer = next(password_answers);
        leave();
        if (!answer) throw tether::PromptError("closed");
        return *answer;
    }

    void write_stderr(std::string_view text) override { written += text; }
    void write_labeled(const std::string&, std::string_view text) override { written += text; }
    tether::ProgressOutput* progress_output() override { return progress; }

private:
    void enter() { if (in_flight.fetch_add(1) != 0) overlapped = true; }
    void leave() { in_flight.fetch_sub(1); }

    static std::optional<std::string> next(std::deque<std::string>& q) {
        if (q.empty()) return std::nullopt;
        auto v = q.front();
        q.pop_front();
        return v;
    }
};

/// Secure prompt stand-in with a fixed answer.
class FixedSource : public tether::PassphraseSource {
public:
    explicit FixedSource(std::optional<std::string> answer, int* calls)
        : answer_(std::move(answer)), calls_(calls) {}

    std::optional<std::string> get_passphrase(const std::string& url) override {
        ++*calls_;
        last_url = url;
        return answer_;
    }

    std::string last_url;

private:
    std::optional<std::string> answer_;
    int*                       calls_;
};

class CapturingOutput : public tether::ProgressOutput {
public:
    std::string text;
    std::optional<uint16_t> term_width() const override { return 40; }
    void write(std::string_view t) override { text += t; }
};

static std::unique_ptr<tether::PassphraseSource> source(std::optional<std::string> answer,
                                                        int* calls) {
    return std::make_unique<FixedSource>(std::move(answer), calls);
}

static const std::string URL = "ssh://git@example.com/repo.git";

// ---------------------------------------------------------------------------
// Terminal prompter
// ---------------------------------------------------------------------------

TEST_CASE("Credentials: terminal prompts are labeled with the URL", "[credentials]") {
    ScriptedUi ui;
    ui.answers = {"alice"};
    ui.password_answers = {"pw"};

    CHECK(tether::terminal_get_username(ui, URL) == std::optional<std::string>("alice"));
    CHECK(tether::terminal_get_password(ui, URL) == std::optional<std::string>("pw"));
    REQUIRE(ui.prompts.size() == 1);
    CHECK(ui.prompts[0] == "Username for " + URL);
    REQUIRE(ui.password_prompts.size() == 1);
    CHECK(ui.password_prompts[0] == "Passphrase for " + URL + ": ");
}

TEST_CASE("Credentials: closed Ui gives no value", "[credentials]") {
    ScriptedUi ui;
    CHECK_FALSE(tether::terminal_get_username(ui, URL).has_value());
    CHECK_FALSE(tether::terminal_get_password(ui, URL).has_value());
}

// ---------------------------------------------------------------------------
// Passphrase chain
// ---------------------------------------------------------------------------

TEST_CASE("Credentials: secure prompt answer skips the terminal", "[credentials]") {
    ScriptedUi ui;
    int calls = 0;
    tether::CredentialResolver resolver(ui, {}, source(std::string("agent-pw"), &calls));

    auto pw = resolver.get_password(URL, "git");
    CHECK(pw == std::optional<std::string>("agent-pw"));
    CHECK(calls == 1);
    CHECK(ui.password_prompts.empty());
}

TEST_CASE("Credentials: terminal is asked once when secure prompt fails", "[credentials]") {
    ScriptedUi ui;
    ui.password_answers = {"term-pw"};
    int calls = 0;
    tether::CredentialResolver resolver(ui, {}, source(std::nullopt, &calls));

    auto pw = resolver.get_password(URL, "git");
    CHECK(pw == std::optional<std::string>("term-pw"));
    CHECK(calls == 1);
    REQUIRE(ui.password_prompts.size() == 1);
    CHECK(ui.password_prompts[0].find(URL) != std::string::npos);
}

TEST_CASE("Credentials: no credential when every strategy fails", "[credentials]") {
    ScriptedUi ui;
    int calls = 0;
    tether::CredentialResolver resolver(ui, {}, source(std::nullopt, &calls));

    CHECK_FALSE(resolver.get_password(URL, "git").has_value());
    CHECK(calls == 1);
    CHECK(ui.password_prompts.size() == 1);
}

// ---------------------------------------------------------------------------
// Username + password
// ---------------------------------------------------------------------------

TEST_CASE("Credentials: username then password from the terminal", "[credentials]") {
    ScriptedUi ui;
    ui.answers = {"alice"};
    ui.password_answers = {"s3cret"};
    int calls = 0;
    tether::CredentialResolver resolver(ui, {}, source(std::string("unused"), &calls));

    auto cred = resolver.get_username_password("https://example.com/r.git");
    REQUIRE(cred.has_value());
    CHECK(cred->username == "alice");
    CHECK(cred->password == "s3cret");
    CHECK(calls == 0); // the secure prompt is for passphrases only
    CHECK(ui.prompts == std::vector<std::string>{"Username for https://example.com/r.git"});
}

TEST_CASE("Credentials: missing username aborts before the password", "[credentials]") {
    ScriptedUi ui;
    ui.password_answers = {"s3cret"};
    int calls = 0;
    tether::CredentialResolver resolver(ui, {}, source(std::nullopt, &calls));

    CHECK_FALSE(resolver.get_username_password(URL).has_value());
    CHECK(ui.password_prompts.empty());
}

TEST_CASE("Credentials: missing password yields nothing", "[credentials]") {
    ScriptedUi ui;
    ui.answers = {"alice"};
    int calls = 0;
    tether::CredentialResolver resolver(ui, {}, source(std::nullopt, &calls));

    CHECK_FALSE(resolver.get_username_password(URL).has_value());
    CHECK(ui.password_prompts.size() == 1);
}

TEST_CASE("Credentials: concurrent callbacks never overlap prompts", "[credentials]") {
    ScriptedUi ui;
    for (int i = 0; i < 8; ++i) {
        ui.answers.push_back("user");
        ui.password_answers.push_back("pw");
    }
    int calls = 0;
    tether::CredentialResolver resolver(ui, {}, source(std::nullopt, &calls));
    auto cbs = resolver.callbacks();

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] { cbs.get_username_password(URL); });
    }
    for (auto& t : threads) t.join();

    CHECK_FALSE(ui.overlapped.load());
    CHECK(ui.prompts.size() == 4);
    CHECK(ui.password_prompts.size() == 4);
}

// ---------------------------------------------------------------------------
// callbacks()
// ---------------------------------------------------------------------------

TEST_CASE("Credentials: callbacks delegate to the resolver", "[credentials]") {
    auto dir = fs::temp_directory_path() /
               ("tether_keys_" + std::to_string(
                    std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir);
    std::ofstream(dir / "id_ed25519") << "key\n";

    ScriptedUi ui;
    ui.password_answers = {"pw"};
    int calls = 0;
    tether::AuthOptions opts;
    opts.ssh_dir = dir;
    tether::CredentialResolver resolver(ui, opts, source(std::nullopt, &calls));
    auto cbs = resolver.callbacks();

    REQUIRE(cbs.get_ssh_keys);
    REQUIRE(cbs.get_password);
    REQUIRE(cbs.get_username_password);

    auto keys = cbs.get_ssh_keys("git");
    REQUIRE(keys.size() == 1);
    CHECK(keys[0] == dir / "id_ed25519");
    CHECK(cbs.get_password(URL, "git") == std::optional<std::string>("pw"));

    fs::remove_all(dir);
}

TEST_CASE("Credentials: no progress callback without progress output", "[credentials]") {
    ScriptedUi ui;
    int calls = 0;
    tether::CredentialResolver resolver(ui, {}, source(std::nullopt, &calls));
    CHECK_FALSE(resolver.callbacks().progress);
}

TEST_CASE("Credentials: progress events reach the progress output", "[credentials]") {
    ScriptedUi ui;
    CapturingOutput out;
    ui.progress = &out;
    int calls = 0;
    tether::CredentialResolver resolver(ui, {}, source(std::nullopt, &calls));
    auto cbs = resolver.callbacks();
    REQUIRE(cbs.progress);

    tether::TransferProgress done;
    done.overall = 1.0f;
    cbs.progress(done);
    CHECK(out.text == "\r\x1b[2K");
}

TEST_CASE("Credentials: with_remote_callbacks returns the body's result", "[credentials]") {
    ScriptedUi ui;
    int seen = tether::with_remote_callbacks(ui, [](tether::RemoteCallbacks& cbs) {
        return cbs.get_ssh_keys ? 42 : 0;
    });
    CHECK(seen == 42);
}

// ---------------------------------------------------------------------------
// credential_helper_fill
// ---------------------------------------------------------------------------

TEST_CASE("Credentials: credential helper only handles http(s)", "[credentials]") {
    CHECK_FALSE(tether::credential_helper_fill("ssh://git@example.com/r.git").has_value());
    CHECK_FALSE(tether::credential_helper_fill("/local/path").has_value());
}

TEST_CASE("Credentials: credential helper rejects unsafe hosts", "[credentials]") {
    CHECK_FALSE(tether::credential_helper_fill("https://exa'mple.com/r").has_value());
    CHECK_FALSE(tether::credential_helper_fill("https://example.com:80;rm/r").has_value());
    CHECK_FALSE(tether::credential_helper_fill("https:///r").has_value());
}
