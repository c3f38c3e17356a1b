#include "rtt_sampler.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>

namespace qdist
{
    RttSampler::RttSampler(event_base *base, Pinger &pinger, const SocketAddress &target, SamplerOptions opts,
                           DiagLogger *diag)
        : pinger_(pinger), target_(target), opts_(opts), diag_(diag),
          timer_(make_timer(base, &RttSampler::on_timer, this)),
          timeout_(make_timer(base, &RttSampler::on_timeout, this)),
          rng_(std::random_device{}())
    {
        if (opts_.attempts == 0)
            throw std::invalid_argument("attempt count must be at least 1");
        scheduled_.reserve(opts_.attempts);
    }

    RttSampler::~RttSampler()
    {
        if (in_flight_)
            pinger_.cancel(*in_flight_);
    }

    void RttSampler::start(Completion done)
    {
        done_ = std::move(done);
        if (opts_.temporize && opts_.window.count() > 0)
        {
            std::uniform_int_distribution<std::chrono::microseconds::rep> dist(0, opts_.window.count() - 1);
            start_delay_ = std::chrono::microseconds(dist(rng_));
        }
        if (diag_)
            diag_->log("SAMPLER", "START peer=" + target_.to_string() + " attempts=" + std::to_string(opts_.attempts) +
                                      " delay_us=" + std::to_string(start_delay_.count()));
        arm_timer(timer_.get(), start_delay_);
    }

    std::chrono::microseconds RttSampler::window_offset(std::size_t n) const
    {
        return static_cast<std::chrono::microseconds::rep>(n) * opts_.window;
    }

    void RttSampler::on_timer(evutil_socket_t, short, void *arg)
    {
        static_cast<RttSampler *>(arg)->begin_attempt();
    }

    void RttSampler::on_timeout(evutil_socket_t, short, void *arg)
    {
        auto *self = static_cast<RttSampler *>(arg);
        if (!self->in_flight_)
            return;
        self->pinger_.cancel(*self->in_flight_);
        self->in_flight_.reset();
        if (self->diag_)
            self->diag_->log("SAMPLER", "TIMEOUT peer=" + self->target_.to_string() + " attempt=" +
                                            std::to_string(self->made_ + 1));
        self->end_attempt(kUnreachable);
    }

    void RttSampler::begin_attempt()
    {
        if (finished_)
            return;
        // Attempt i is due at first_start + (i-1) * window, however long earlier attempts took.
        clk::time_point due = scheduled_.empty() ? clk::now() : scheduled_.front() + window_offset(made_);
        scheduled_.push_back(due);

        const std::size_t attempt = made_;
        try
        {
            in_flight_ = pinger_.ping(target_, [this, attempt](SampleResult rtt) {
                if (finished_ || attempt != made_ || !in_flight_)
                    return;
                evtimer_del(timeout_.get());
                in_flight_.reset();
                end_attempt(rtt);
            });
        }
        catch (const std::exception &e)
        {
            if (diag_)
                diag_->log("SAMPLER", "TASK_ERR peer=" + target_.to_string() + " " + e.what());
            complete(std::nullopt);
            return;
        }
        if (!rearm(timeout_.get(), opts_.window))
            return;
    }

    void RttSampler::end_attempt(SampleResult rtt)
    {
        best_ = std::min(best_, rtt);
        ++made_;
        if (diag_)
            diag_->log("SAMPLER", "ATTEMPT peer=" + target_.to_string() + " n=" + std::to_string(made_) + " rtt_us=" +
                                      (rtt == kUnreachable ? std::string("-") : std::to_string(rtt)));
        if (made_ >= opts_.attempts)
        {
            complete(best_);
            return;
        }
        clk::time_point next = scheduled_.front() + window_offset(made_);
        rearm(timer_.get(), std::chrono::duration_cast<std::chrono::microseconds>(next - clk::now()));
    }

    // Runs from loop callbacks, so a timer that cannot be armed ends the task instead of unwinding.
    bool RttSampler::rearm(event *ev, std::chrono::microseconds d)
    {
        try
        {
            arm_timer(ev, d);
            return true;
        }
        catch (const std::runtime_error &e)
        {
            if (diag_)
                diag_->log("SAMPLER", "TASK_ERR peer=" + target_.to_string() + " " + e.what());
            if (in_flight_)
            {
                pinger_.cancel(*in_flight_);
                in_flight_.reset();
            }
            complete(std::nullopt);
            return false;
        }
    }

    void RttSampler::complete(std::optional<SampleResult> result)
    {
        finished_ = true;
        evtimer_del(timer_.get());
        evtimer_del(timeout_.get());
        if (done_)
        {
            Completion done = std::move(done_);
            done_ = nullptr;
            done(result);
        }
    }
} // namespace qdist
