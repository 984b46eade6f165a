#include "worker_pool.h"

#include <stdexcept>

#include <glog/logging.h>
#include "absl/time/time.h"

#include "common/errors.h"

namespace Vigil {

namespace {

double NowSeconds() {
	return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

WorkerPool::WorkerPool(Collaborators collaborators, WorkerPoolOptions options)
	: ctx_(std::make_shared<Context>()) {
	if (!collaborators.limiter || !collaborators.selector || !collaborators.router ||
			!collaborators.store || !collaborators.metrics || !collaborators.errors) {
		throw ConfigurationError("Worker pool is missing a collaborator");
	}
	ctx_->collaborators = std::move(collaborators);
	ctx_->options = options;
}

WorkerPool::~WorkerPool() {
	if (started_ && !stopped_) {
		Shutdown(std::chrono::milliseconds(shutdown_grace_ms));
	}
}

void WorkerPool::Run(int worker_count, std::shared_ptr<ShutdownSignal> shutdown) {
	if (worker_count < 1) {
		throw ConfigurationError("Worker count must be at least 1, got " + std::to_string(worker_count));
	}
	if (started_) {
		throw std::logic_error("Worker pool already started");
	}
	started_ = true;
	ctx_->shutdown = shutdown ? std::move(shutdown) : std::make_shared<ShutdownSignal>();
	{
		absl::MutexLock lock(&ctx_->mu);
		ctx_->active = worker_count;
		ctx_->exited.assign(worker_count, false);
	}

	std::random_device rd;
	threads_.reserve(worker_count);
	for (int i = 0; i < worker_count; ++i) {
		WorkerStats* stats = ctx_->collaborators.metrics->RegisterWorker(i);
		const uint64_t seed = ctx_->options.seed != 0
			? Mix64(ctx_->options.seed + static_cast<uint64_t>(i))
			: (static_cast<uint64_t>(rd()) << 32) ^ rd();
		threads_.emplace_back(&WorkerPool::WorkerLoop, ctx_, stats, i, seed);
	}
	LOG(INFO) << "Started " << worker_count << " workers at " << ctx_->collaborators.limiter->rate()
		<< " ops/s";
}

void WorkerPool::WorkerLoop(std::shared_ptr<Context> ctx, WorkerStats* stats, int worker_id, uint64_t seed) {
	Collaborators& c = ctx->collaborators;
	DocumentFactory factory(c.router.get(), seed);

	while (!ctx->shutdown->raised()) {
		AcquireStatus status = c.limiter->Acquire(1.0, ctx->options.acquire_timeout);
		if (status == AcquireStatus::TIMEOUT) {
			// Rate wait, not an error
			stats->RecordAcquireTimeout();
			continue;
		}
		if (status != AcquireStatus::GRANTED) {
			if (status == AcquireStatus::EXCEEDS_CAPACITY) {
				LOG(ERROR) << "Worker " << worker_id << " cannot acquire from the limiter: "
					<< AcquireStatusName(status);
			}
			break;
		}
		c.metrics->RecordGrant();
		if (ctx->shutdown->raised()) {
			break;
		}

		const OperationKind kind = c.selector->Select(factory.rng());
		stats->RecordAttempt(kind);
		OperationEvent event = Execute(*ctx, kind, factory, worker_id);
		stats->RecordOutcome(kind, event.outcome);
		c.metrics->Record(event);

		if (event.outcome == OperationOutcome::SUCCESS) {
			VLOG(3) << "worker " << worker_id << " " << OperationKindName(kind) << " " << event.key_id
				<< " " << event.duration.count() << "us";
			continue;
		}

		ErrorEvent error;
		error.source = "operation";
		error.kind = kind;
		error.key = event.key_id;
		error.code = event.outcome == OperationOutcome::UNEXPECTED_ERROR
			? std::string("EXCEPTION")
			: std::string(StorageCodeName(event.code)) + (event.transient ? "/transient" : "/fatal");
		error.message = event.message;
		error.worker_id = worker_id;
		try {
			c.errors->Report(error);
		} catch (const std::exception& e) {
			LOG(ERROR) << "Worker " << worker_id << " could not report an error: " << e.what();
		}

		ctx->shutdown->WaitFor(ctx->options.error_backoff);
	}

	absl::MutexLock lock(&ctx->mu);
	ctx->exited[worker_id] = true;
	--ctx->active;
	ctx->exited_cv.SignalAll();
	VLOG(1) << "Worker " << worker_id << " exited";
}

OperationEvent WorkerPool::Execute(Context& ctx, OperationKind kind, DocumentFactory& factory, int worker_id) {
	Collaborators& c = ctx.collaborators;
	OperationEvent event;
	event.worker_id = worker_id;
	event.kind = kind;

	const auto start = std::chrono::steady_clock::now();
	StorageResult result;
	try {
		switch (kind) {
			case OperationKind::FIND: {
				DocumentKey key = c.router->BuildKey(c.router->RandomExistingSequence(factory.rng()));
				event.key_id = key.id();
				Document doc;
				bool found = false;
				result = c.store->Find(key, &doc, &found);
				break;
			}
			case OperationKind::INSERT: {
				Document doc = factory.Make(c.router->NextInsertSequence());
				event.key_id = doc.id();
				result = c.store->Insert(doc);
				break;
			}
			case OperationKind::UPDATE: {
				DocumentKey key = c.router->BuildKey(c.router->RandomExistingSequence(factory.rng()));
				event.key_id = key.id();
				UpdateSpec update;
				update.set_inc_n(1);
				update.set_set_ts(NowSeconds());
				update.set_upsert(ctx.options.upsert_on_update);
				result = c.store->Update(key, update);
				break;
			}
		}
		event.outcome = result.ok() ? OperationOutcome::SUCCESS : OperationOutcome::OPERATION_ERROR;
		event.code = result.code;
		event.transient = result.transient;
		event.message = result.message;
	} catch (const std::exception& e) {
		event.outcome = OperationOutcome::UNEXPECTED_ERROR;
		event.code = StorageCode::INTERNAL;
		event.message = e.what();
	}
	event.duration = std::chrono::duration_cast<std::chrono::microseconds>(
			std::chrono::steady_clock::now() - start);
	return event;
}

DrainReport WorkerPool::Shutdown(std::chrono::milliseconds grace) {
	if (!started_ || stopped_) {
		return report_;
	}
	stopped_ = true;

	const auto begin = std::chrono::steady_clock::now();
	ctx_->shutdown->Raise();
	ctx_->collaborators.limiter->Stop();

	std::vector<bool> exited;
	int remaining = 0;
	{
		const absl::Time deadline = absl::Now() + absl::FromChrono(grace);
		absl::MutexLock lock(&ctx_->mu);
		while (ctx_->active > 0) {
			if (ctx_->exited_cv.WaitWithDeadline(&ctx_->mu, deadline)) {
				break;
			}
		}
		remaining = ctx_->active;
		exited = ctx_->exited;
	}

	for (size_t i = 0; i < threads_.size(); ++i) {
		if (exited[i]) {
			threads_[i].join();
		} else {
			threads_[i].detach();
		}
	}
	threads_.clear();

	report_.workers = static_cast<int>(exited.size());
	report_.abandoned = remaining;
	report_.drained = remaining == 0;
	report_.waited = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - begin);
	if (report_.drained) {
		LOG(INFO) << "All " << report_.workers << " workers drained in " << report_.waited.count() << "ms";
	} else {
		LOG(WARNING) << report_.abandoned << " of " << report_.workers
			<< " workers not drained after " << grace.count() << "ms grace; abandoning them";
	}
	return report_;
}

int WorkerPool::active_workers() const {
	absl::MutexLock lock(&ctx_->mu);
	return ctx_->active;
}

} // namespace Vigil
