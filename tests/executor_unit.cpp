// FFmpegExecutor against real child processes: large outputs, exit codes and
// the timeout. /bin/sh stands in for the media tools.
#include <iostream>
#include <string>

#include "../src/core/ProcessManager.h"
#include "../src/rendering/FFmpegExecutor.h"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[executor_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

const char *const shell = "/bin/sh";

void use_shell(FFmpegExecutor &executor) {
    executor.setToolPaths(shell, shell);
}

juce::StringArray shell_command(const juce::String &script) {
    juce::StringArray args;
    args.add("-c");
    args.add(script);
    return args;
}

bool test_large_output() {
    FFmpegExecutor executor;
    use_shell(executor);
    executor.setTimeoutMs(20000);

    const juce::uint32 started = juce::Time::getMillisecondCounter();
    auto result = executor.runFFprobe(shell_command("head -c 200000 /dev/zero | tr '\\000' x"));
    const juce::uint32 elapsed = juce::Time::getMillisecondCounter() - started;

    bool ok = check(result.wasOk(), "output larger than a pipe buffer completes");
    if (result.wasOk()) {
        ok &= check(result.getValue().length() == 200000, "every byte is read");
    }
    ok &= check(elapsed < 15000, "finished well before the timeout");
    return ok;
}

bool test_exit_code() {
    FFmpegExecutor executor;
    use_shell(executor);

    auto result = executor.runFFprobe(shell_command("echo first; echo last reason; exit 3"));
    bool ok = check(result.failed(), "non-zero exit fails");
    if (result.failed()) {
        ok &= check(result.getError().kind == ClipErrorKind::ToolInvocation, "tool failure kind");
        ok &= check(result.getError().message.contains("exit code: 3"), "exit code reported");
        ok &= check(result.getError().message.contains("last reason"), "last output line reported");
        ok &= check(!result.getError().retryable, "plain failure is not retryable");
        ok &= check(result.getError().command.startsWith(shell), "command rebuilt");
    }
    return ok;
}

bool test_timeout() {
    FFmpegExecutor executor;
    use_shell(executor);
    executor.setTimeoutMs(300);

    const juce::uint32 started = juce::Time::getMillisecondCounter();
    auto result = executor.runFFprobe(shell_command("exec sleep 10"));
    const juce::uint32 elapsed = juce::Time::getMillisecondCounter() - started;

    bool ok = check(result.failed(), "slow child fails");
    if (result.failed()) {
        ok &= check(result.getError().kind == ClipErrorKind::ToolInvocation, "timeout kind");
        ok &= check(result.getError().retryable, "timeout is retryable");
        ok &= check(result.getError().message.contains("timed out"), "timeout message");
    }
    ok &= check(elapsed < 5000, "child killed at the timeout");
    ok &= check(ProcessManager::getInstance().getNumActiveProcesses() == 0, "child unregistered");
    return ok;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_large_output();
    ok &= test_exit_code();
    ok &= test_timeout();

    if (!ok) {
        return 1;
    }
    std::cout << "executor_unit OK\n";
    return 0;
}
