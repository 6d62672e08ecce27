#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <Poco/StreamCopier.h>
#include <Poco/TemporaryFile.h>

namespace fs = std::filesystem;

/// Runs the installed binary as a child process, the path comes from the build system.
#ifndef MDTOUCH_BINARY_PATH
#error "MDTOUCH_BINARY_PATH must be defined"
#endif

namespace
{

struct RunResult
{
    int exit_code = -1;
    std::string out;
    std::string err;
};

RunResult runBinary(const std::vector<std::string> & args, const Poco::Process::Env & env = {})
{
    Poco::Pipe out_pipe;
    Poco::Pipe err_pipe;
    Poco::ProcessHandle handle = Poco::Process::launch(MDTOUCH_BINARY_PATH, args, "", nullptr, &out_pipe, &err_pipe, env);

    RunResult result;

    /// Both pipes are drained at once, so the child never blocks on a full pipe.
    std::thread err_reader([&err_pipe, &result]
    {
        Poco::PipeInputStream err_stream(err_pipe);
        Poco::StreamCopier::copyToString(err_stream, result.err);
    });

    Poco::PipeInputStream out_stream(out_pipe);
    Poco::StreamCopier::copyToString(out_stream, result.out);
    err_reader.join();

    result.exit_code = handle.wait();
    return result;
}

}

TEST(MDTouchBinary, PrintsBannerWithoutArguments)
{
    auto result = runBinary({});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.out.find("mdtouch"), std::string::npos) << result.out;
    EXPECT_NE(result.out.find("A tool to update file timestamps"), std::string::npos) << result.out;
}

TEST(MDTouchBinary, PrintsHelp)
{
    auto result = runBinary({"-h"});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.out.find("Usage:"), std::string::npos) << result.out;
    EXPECT_TRUE(result.err.empty()) << result.err;
}

TEST(MDTouchBinary, TouchesFiles)
{
    Poco::TemporaryFile tmp_dir;
    tmp_dir.createDirectories();
    auto first = (fs::path(tmp_dir.path()) / "a.txt").string();
    auto second = (fs::path(tmp_dir.path()) / "b.txt").string();

    auto result = runBinary({first, second});
    EXPECT_EQ(result.exit_code, 0) << result.err;
    EXPECT_TRUE(result.out.empty());
    EXPECT_TRUE(fs::is_regular_file(first));
    EXPECT_TRUE(fs::is_regular_file(second));
}

TEST(MDTouchBinary, FailsWithoutParentDirectory)
{
    Poco::TemporaryFile tmp_dir;
    tmp_dir.createDirectories();
    auto bad = (fs::path(tmp_dir.path()) / "non_existent_dir" / "file.txt").string();

    auto result = runBinary({bad});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.err.find("Error touching " + bad), std::string::npos) << result.err;
}

TEST(MDTouchBinary, TraceLoggingLargerThanPipeBuffer)
{
    Poco::TemporaryFile tmp_dir;
    tmp_dir.createDirectories();

    std::vector<std::string> args;
    for (size_t i = 0; i < 2000; ++i)
        args.push_back((fs::path(tmp_dir.path()) / ("file_" + std::to_string(i) + ".txt")).string());

    auto result = runBinary(args, {{"MDTOUCH_LOG_LEVEL", "trace"}});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_GT(result.err.size(), 65536u);
    EXPECT_NE(result.err.find("Touched 2000 files"), std::string::npos);
    EXPECT_TRUE(fs::is_regular_file(args.back()));
}
