#include "TransferRegistry.hpp"
#include <QLoggingCategory>
#include <algorithm>
Q_LOGGING_CATEGORY(ocRegistry, "openxfer.registry")

ActiveTransfer::ActiveTransfer(QString key, QString connectionId,
                               TransferKind kind, QString source,
                               QString target, QString workingPath)
    : key_(std::move(key)), connectionId_(std::move(connectionId)),
      kind_(kind), source_(std::move(source)), target_(std::move(target)),
      workingPath_(std::move(workingPath)),
      token_(std::make_shared<CancelToken>()) {}

TransferState ActiveTransfer::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

void ActiveTransfer::setState(TransferState state) {
    std::lock_guard<std::mutex> lk(mtx_);
    state_ = state;
}

void ActiveTransfer::addStream(const StreamHandlePtr &stream) {
    bool lateCancel = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        streams_.push_back(stream);
        lateCancel = token_->isCancelled();
    }
    if (lateCancel)
        stream->destroy(openxfer::ErrorKind::Cancelled, token_->reason());
}

void ActiveTransfer::removeStream(const StreamHandlePtr &stream) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        streams_.erase(std::remove(streams_.begin(), streams_.end(), stream),
                       streams_.end());
    }
    stream->detach();
}

int ActiveTransfer::destroyStreams(openxfer::ErrorKind kind,
                                   const QString &reason) {
    std::vector<StreamHandlePtr> victims;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        victims = streams_;
    }
    for (auto &s : victims)
        s->destroy(kind, reason);
    return static_cast<int>(victims.size());
}

int ActiveTransfer::activeStreams() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(streams_.size());
}

bool TransferRegistry::registerTransfer(const TransferPtr &transfer) {
    if (!transfer)
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    return transfers_.emplace(transfer->key(), transfer).second;
}

TransferPtr TransferRegistry::get(const QString &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = transfers_.find(key);
    return it == transfers_.end() ? nullptr : it->second;
}

TransferPtr TransferRegistry::cancel(const QString &key,
                                     const QString &connectionId,
                                     const QString &reason) {
    TransferPtr t;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = transfers_.find(key);
        if (it == transfers_.end() && !connectionId.isEmpty()) {
            const QString prefix = connectionId + '-';
            it = std::find_if(transfers_.begin(), transfers_.end(),
                              [&](const auto &kv) {
                                  return kv.first.startsWith(prefix) &&
                                         kv.second->connectionId() ==
                                             connectionId;
                              });
            if (it != transfers_.end())
                qCInfo(ocRegistry) << "Cancel fell back to connection prefix"
                                   << "requested=" << key
                                   << "matched=" << it->first;
        }
        if (it == transfers_.end()) {
            qCInfo(ocRegistry) << "Cancel found no transfer" << "key=" << key;
            return nullptr;
        }
        t = it->second;
        transfers_.erase(it);
    }
    // Token first, so a stream registered concurrently is torn down too.
    t->token()->cancel(reason);
    t->setState(TransferState::Cancelled);
    const int destroyed =
        t->destroyStreams(openxfer::ErrorKind::Cancelled, reason);
    qCInfo(ocRegistry) << "Transfer cancelled" << "key=" << t->key()
                       << "kind=" << transferKindName(t->kind())
                       << "streamsDestroyed=" << destroyed;
    return t;
}

bool TransferRegistry::remove(const QString &key) {
    std::lock_guard<std::mutex> lk(mtx_);
    return transfers_.erase(key) > 0;
}

QStringList
TransferRegistry::keysForConnection(const QString &connectionId) const {
    QStringList out;
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &kv : transfers_)
        if (kv.second->connectionId() == connectionId)
            out << kv.first;
    return out;
}

int TransferRegistry::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(transfers_.size());
}
