#include <harbor/process/process.hpp>
#include <log/log.hpp>

#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/process/v2.hpp>

#include <mutex>
#include <csignal>

#include <signal.h>

namespace bp2 = boost::process::v2;

namespace Harbor
{
    struct Process::Implementation
    {
        boost::asio::any_io_executor executor;
        std::unique_ptr<bp2::process> child;
        std::optional<int> exitCode;

        std::function<void(std::string_view)> onStdoutLine;
        std::function<void(std::string_view)> onStderrLine;

        std::vector<char> stdoutBuffer;
        std::vector<char> stderrBuffer;
        std::string stdoutPending;
        std::string stderrPending;

        boost::asio::readable_pipe stdoutPipe;
        boost::asio::readable_pipe stderrPipe;
        boost::asio::writable_pipe stdinPipe;

        std::recursive_mutex childGuard;

        Implementation(boost::asio::any_io_executor executor)
            : executor{std::move(executor)}
            , child{}
            , exitCode{}
            , onStdoutLine{}
            , onStderrLine{}
            , stdoutBuffer(4096)
            , stderrBuffer(4096)
            , stdoutPending{}
            , stderrPending{}
            , stdoutPipe{this->executor}
            , stderrPipe{this->executor}
            , stdinPipe{this->executor}
            , childGuard{}
        {}

        static void emitLines(std::string& pending, std::function<void(std::string_view)> const& onLine)
        {
            std::size_t start = 0;
            for (auto newline = pending.find('\n'); newline != std::string::npos;
                 newline = pending.find('\n', start))
            {
                auto line = std::string_view{pending}.substr(start, newline - start);
                if (!line.empty() && line.back() == '\r')
                    line.remove_suffix(1);
                if (onLine && !line.empty())
                    onLine(line);
                start = newline + 1;
            }
            pending.erase(0, start);
        }

        void read(
            std::shared_ptr<Process> proc,
            boost::asio::readable_pipe Process::Implementation::*pipe,
            std::function<void(std::string_view)> Process::Implementation::*onLine,
            std::vector<char> Process::Implementation::*buffer,
            std::string Process::Implementation::*pending)
        {
            auto& pipeRef = proc->impl_.get()->*pipe;
            pipeRef.async_read_some(
                boost::asio::buffer(proc->impl_.get()->*buffer),
                [weak = proc->weak_from_this(), pipe, onLine, buffer, pending](
                    boost::system::error_code ec, std::size_t bytesTransferred) mutable {
                    auto self = weak.lock();
                    if (!self)
                        return;

                    auto& impl = *self->impl_;
                    auto& pendingRef = impl.*pending;
                    pendingRef.append((impl.*buffer).data(), bytesTransferred);
                    emitLines(pendingRef, impl.*onLine);

                    if (ec)
                    {
                        if (!pendingRef.empty() && impl.*onLine)
                            (impl.*onLine)(pendingRef);
                        pendingRef.clear();
                        return;
                    }

                    impl.read(self, pipe, onLine, buffer, pending);
                });
        }

        bool isRunning()
        {
            std::scoped_lock lock{childGuard};
            if (!child)
                return false;
            boost::system::error_code ec;
            const bool running = child->running(ec);
            if (!running && !exitCode)
                exitCode = child->exit_code();
            return running && !ec;
        }
    };

    Process::Process(boost::asio::any_io_executor executor)
        : impl_{std::make_unique<Implementation>(std::move(executor))}
    {}
    Process::~Process()
    {
        if (!impl_)
            return;
        try
        {
            if (impl_->isRunning())
                terminate();
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to terminate process on destruction: {}", e.what());
        }
    }
    ROAR_PIMPL_SPECIAL_FUNCTIONS_IMPL_NO_DTOR(Process);

    void Process::spawn(
        std::string const& executable,
        std::vector<std::string> const& arguments,
        Environment const& environment)
    {
        std::scoped_lock lock{impl_->childGuard};

        std::unordered_map<bp2::environment::key, bp2::environment::value> env;
        for (auto const& [key, value] : environment.environment())
        {
            if (key.empty())
                continue;
            env.emplace(key, value);
        }

        auto resolved = bp2::environment::find_executable(executable, env);
        if (resolved.empty())
            resolved = executable;

        impl_->exitCode.reset();
        impl_->child = std::make_unique<bp2::process>(
            impl_->executor,
            resolved,
            arguments,
            bp2::process_environment{env},
            bp2::process_stdio{impl_->stdinPipe, impl_->stdoutPipe, impl_->stderrPipe});
    }

    void Process::signal(int signal)
    {
        std::scoped_lock lock{impl_->childGuard};
        if (!impl_->child)
            return;
        ::kill(static_cast<pid_t>(impl_->child->id()), signal);
    }

    void Process::terminate()
    {
        std::scoped_lock lock{impl_->childGuard};
        if (!impl_->isRunning())
            return;

        boost::system::error_code ec;
        impl_->child->terminate(ec);
        impl_->child->wait(ec);
        impl_->exitCode = impl_->child->exit_code();
    }

    std::optional<int> Process::wait()
    {
        std::scoped_lock lock{impl_->childGuard};
        if (!impl_->child)
            return std::nullopt;
        if (impl_->exitCode)
            return impl_->exitCode;

        boost::system::error_code ec;
        impl_->child->wait(ec);
        if (ec)
        {
            Log::warn("Waiting for process {} failed: {}", pid(), ec.message());
            return std::nullopt;
        }
        impl_->exitCode = impl_->child->exit_code();
        return impl_->exitCode;
    }

    std::optional<int> Process::exitCode() const
    {
        std::scoped_lock lock{impl_->childGuard};
        return impl_->exitCode;
    }

    long long Process::pid() const
    {
        std::scoped_lock lock{impl_->childGuard};
        if (!impl_->child)
            return 0;
        return static_cast<long long>(impl_->child->id());
    }

    bool Process::running() const
    {
        return impl_->isRunning();
    }

    void Process::startReading(
        std::function<void(std::string_view)> onStdoutLine,
        std::function<void(std::string_view)> onStderrLine)
    {
        impl_->onStdoutLine = std::move(onStdoutLine);
        impl_->onStderrLine = std::move(onStderrLine);

        impl_->read(
            shared_from_this(),
            &Process::Implementation::stdoutPipe,
            &Process::Implementation::onStdoutLine,
            &Process::Implementation::stdoutBuffer,
            &Process::Implementation::stdoutPending);

        impl_->read(
            shared_from_this(),
            &Process::Implementation::stderrPipe,
            &Process::Implementation::onStderrLine,
            &Process::Implementation::stderrBuffer,
            &Process::Implementation::stderrPending);
    }
}
