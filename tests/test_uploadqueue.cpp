#include <QtTest>
#include <QTemporaryDir>
#include <QSignalSpy>

#include "mocks/mockuploadtransport.h"
#include "models/uploadqueue.h"
#include "services/httpuploadtransport.h"

class TestUploadQueue : public QObject
{
    Q_OBJECT

private:
    MockUploadTransport *mock;
    UploadQueue *queue;
    QTemporaryDir tempDir;
    QStringList events;

    QString makeFile(const QString &name, int size = 10)
    {
        const QString path = tempDir.filePath(name);
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return QString();
        }
        file.write(QByteArray(size, 'x'));
        return path;
    }

    QStringList makeFiles(const QStringList &names)
    {
        QStringList paths;
        for (const QString &name : names) {
            paths << makeFile(name);
        }
        return paths;
    }

    // Options whose hooks append a line per event to `events`
    UploaderOptions recordingOptions()
    {
        UploaderOptions options;
        UploaderCallbacks &hooks = options.callbacks;

        hooks.onFileQueued = [this](const UploadItem &item) {
            events << "queued:" + item.file().name;
        };
        hooks.onFileDequeued = [this](const UploadItem *item) {
            events << "dequeued:" + (item ? item->file().name : QString("all"));
        };
        hooks.onStart = [this]() { events << "start"; };
        hooks.onCancel = [this]() { events << "cancel"; };
        hooks.onFinished = [this]() { events << "finished"; };
        hooks.onError = [this](const FileCandidate &candidate, const UploadFilter &filter,
                               const UploaderConfig &) {
            events << "rejected:" + candidate.name + ":" + filter.name;
        };
        hooks.onUploadStart = [this](const UploadItem &item) {
            events << "uploadStart:" + item.file().name;
        };
        hooks.onUploadSuccess = [this](const UploadItem &item, const QByteArray &,
                                       int status, const ResponseHeaders &) {
            events << QString("success:%1:%2").arg(item.file().name).arg(status);
        };
        hooks.onUploadError = [this](const UploadItem &item, const QByteArray &,
                                     int status, const ResponseHeaders &) {
            events << QString("error:%1:%2").arg(item.file().name).arg(status);
        };
        hooks.onUploadCancel = [this](const UploadItem &item, const QByteArray &,
                                      int, const ResponseHeaders &) {
            events << "cancelled:" + item.file().name;
        };
        hooks.onUploadComplete = [this](const UploadItem &item, const QByteArray &,
                                        int, const ResponseHeaders &) {
            events << "complete:" + item.file().name;
        };
        return options;
    }

    const UploadItem *itemAt(int row) const
    {
        return queue->item(ItemRef::atIndex(row));
    }

private slots:
    void initTestCase()
    {
        QVERIFY(tempDir.isValid());
        qRegisterMetaType<UploadItem::State>();
    }

    void init()
    {
        mock = new MockUploadTransport(this);
        queue = new UploadQueue(this);
        queue->setTransport(mock);
        events.clear();
    }

    void cleanup()
    {
        delete queue;
        delete mock;
        queue = nullptr;
        mock = nullptr;
    }

    // ========== Admission ==========

    void testAddKeepsInsertionOrder()
    {
        queue->setOptions(recordingOptions());
        UploaderOptions autoStart;
        autoStart.autoUpload = true;

        queue->add(makeFiles({"a.txt", "b.txt", "c.txt"}), autoStart);

        QCOMPARE(queue->count(), 3);
        QCOMPARE(itemAt(0)->file().name, QString("a.txt"));
        QCOMPARE(itemAt(2)->file().name, QString("c.txt"));
        QVERIFY(itemAt(0)->id() < itemAt(1)->id());
        QVERIFY(itemAt(1)->id() < itemAt(2)->id());
        QCOMPARE(itemAt(1)->state(), UploadItem::State::Queued);
        QVERIFY(!itemAt(1)->isReady());
        QCOMPARE(events, QStringList({"queued:a.txt", "queued:b.txt", "queued:c.txt"}));

        // autoUpload never starts the queue by itself
        QCOMPARE(mock->mockGetRequests().size(), 0);
        QVERIFY(!queue->isUploading());
    }

    void testQueueLimitRejectsOverflow()
    {
        UploaderOptions options = recordingOptions();
        options.limit = 2;
        queue->setOptions(options);

        queue->add(makeFiles({"a.txt", "b.txt", "c.txt"}));

        QCOMPARE(queue->count(), 2);
        QCOMPARE(events, QStringList({"queued:a.txt", "queued:b.txt", "rejected:c.txt:queueLimit"}));
    }

    void testFileSizeRejectsLargeFile()
    {
        UploaderOptions options = recordingOptions();
        options.size = 5;
        queue->setOptions(options);

        queue->add(QStringList{makeFile("big.bin", 10)});

        QCOMPARE(queue->count(), 0);
        QCOMPARE(events, QStringList({"rejected:big.bin:fileSize"}));
    }

    void testCallSiteOptionsOverrideQueue()
    {
        UploaderOptions options;
        options.url = QUrl("http://queue.example.com/upload");
        queue->setOptions(options);

        UploaderOptions callSite;
        callSite.url = QUrl("http://callsite.example.com/upload");
        callSite.method = "PUT";
        queue->add(QStringList{makeFile("a.txt")}, callSite);
        queue->add(QStringList{makeFile("b.txt")});

        queue->uploadAll();
        mock->mockCompleteNext(200);

        const QList<UploadRequest> requests = mock->mockGetRequests();
        QCOMPARE(requests.size(), 2);
        QCOMPARE(requests[0].url, QUrl("http://callsite.example.com/upload"));
        QCOMPARE(requests[0].method, QString("PUT"));
        QCOMPARE(requests[1].url, QUrl("http://queue.example.com/upload"));
        QCOMPARE(requests[1].method, QString("POST"));
    }

    void testCallSiteLimitAppliesToThatAdmission()
    {
        queue->setOptions(recordingOptions());
        queue->add(makeFiles({"a.txt", "b.txt"}));

        UploaderOptions callSite;
        callSite.limit = 2;
        queue->add(QStringList{makeFile("c.txt")}, callSite);
        QCOMPARE(queue->count(), 2);
        QVERIFY(events.contains("rejected:c.txt:queueLimit"));

        // Queue configuration itself was not changed
        queue->add(QStringList{makeFile("d.txt")});
        QCOMPARE(queue->count(), 3);
    }

    void testNamedFilterSelection()
    {
        UploaderOptions options = recordingOptions();
        options.size = 5;
        options.limit = 1;
        queue->setOptions(options);

        // Only the queue limit runs, so the oversized file gets in
        queue->add(QStringList{makeFile("big.bin", 10)}, UploaderOptions(), "queueLimit");
        QCOMPARE(queue->count(), 1);

        // Only the size filter runs, so the limit is not enforced
        queue->add(QStringList{makeFile("small.bin", 2)}, UploaderOptions(), "fileSize");
        QCOMPARE(queue->count(), 2);

        queue->add(QStringList{makeFile("other.bin", 2)}, UploaderOptions(), "queueLimit fileSize");
        QCOMPARE(queue->count(), 2);
        QCOMPARE(events.last(), QString("rejected:other.bin:queueLimit"));
    }

    void testBlankFilterSelectionRunsAllFilters()
    {
        UploaderOptions options = recordingOptions();
        options.limit = 1;
        queue->setOptions(options);

        queue->add(QStringList{makeFile("a.bin"), makeFile("b.bin")}, UploaderOptions(), "");

        QCOMPARE(queue->count(), 1);
        QCOMPARE(events.last(), QString("rejected:b.bin:queueLimit"));
    }

    void testExplicitFilterList()
    {
        queue->setOptions(recordingOptions());
        UploadFilterList filters = {{"noText", [](const FileCandidate &file, const FilterContext &) {
            return !file.name.endsWith(".txt");
        }}};

        queue->add(QStringList{makeFile("a.txt"), makeFile("b.bin")}, UploaderOptions(), filters);

        QCOMPARE(queue->count(), 1);
        QCOMPARE(itemAt(0)->file().name, QString("b.bin"));
        QVERIFY(events.contains("rejected:a.txt:noText"));
        QVERIFY(queue->config().findFilter("noText") == nullptr);
    }

    // ========== Upload lifecycle ==========

    void testSingleUploadSuccess()
    {
        queue->setOptions(recordingOptions());
        queue->add(QStringList{makeFile("a.txt")});
        events.clear();

        queue->uploadAll();
        QVERIFY(queue->isUploading());
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Uploading);

        mock->mockCompleteNext(200, "stored");

        QCOMPARE(itemAt(0)->state(), UploadItem::State::Success);
        QCOMPARE(itemAt(0)->status(), 200);
        QCOMPARE(itemAt(0)->response().body, QByteArray("stored"));
        QCOMPARE(itemAt(0)->progress(), 100);
        QCOMPARE(queue->uploadedCount(), 1);
        QCOMPARE(queue->notUploadedCount(), 0);
        QCOMPARE(queue->progress(), 100);
        QVERIFY(!queue->isUploading());
        QCOMPARE(events, QStringList({"start", "uploadStart:a.txt", "success:a.txt:200",
                                      "complete:a.txt", "finished"}));
    }

    void testErrorThenNextItemSucceeds()
    {
        queue->setOptions(recordingOptions());
        queue->add(makeFiles({"a.txt", "b.txt"}));
        events.clear();

        queue->uploadAll();
        mock->mockCompleteNext(500, "boom");

        QCOMPARE(itemAt(0)->state(), UploadItem::State::Error);
        QCOMPARE(itemAt(1)->state(), UploadItem::State::Uploading);

        mock->mockCompleteNext(201);

        QCOMPARE(itemAt(1)->state(), UploadItem::State::Success);
        QCOMPARE(events, QStringList({"start",
                                      "uploadStart:a.txt", "error:a.txt:500", "complete:a.txt",
                                      "uploadStart:b.txt", "success:b.txt:201", "complete:b.txt",
                                      "finished"}));
    }

    void testNetworkFailureIsError()
    {
        queue->add(QStringList{makeFile("a.txt")});
        queue->uploadAll();

        mock->mockFailNext("Connection refused");

        QCOMPARE(itemAt(0)->state(), UploadItem::State::Error);
        QCOMPARE(itemAt(0)->status(), 0);
        QCOMPARE(itemAt(0)->response().errorString, QString("Connection refused"));
    }

    void testCancelItemAfterAbortCompletes()
    {
        queue->setOptions(recordingOptions());
        queue->add(makeFiles({"a.txt", "b.txt"}));
        queue->uploadAll();
        events.clear();

        mock->mockSetDeferAborts(true);
        const quint64 firstId = itemAt(0)->id();
        queue->cancelItem(ItemRef::atIndex(0));

        // Still uploading until the transport reports the abort
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Uploading);
        QCOMPARE(mock->mockGetAbortRequests(), QList<quint64>({firstId}));
        QVERIFY(events.isEmpty());

        mock->mockFinishAbort(firstId);

        QCOMPARE(itemAt(0)->state(), UploadItem::State::Cancelled);
        QCOMPARE(itemAt(1)->state(), UploadItem::State::Uploading);
        QCOMPARE(events, QStringList({"cancelled:a.txt", "complete:a.txt", "uploadStart:b.txt"}));
    }

    void testCancelItemNotUploadingDoesNothing()
    {
        queue->add(QStringList{makeFile("a.txt")});
        queue->cancelItem(ItemRef::atIndex(0));

        QCOMPARE(itemAt(0)->state(), UploadItem::State::Queued);
        QVERIFY(mock->mockGetAbortRequests().isEmpty());
    }

    void testCancelAll()
    {
        queue->setOptions(recordingOptions());
        queue->add(makeFiles({"a.txt", "b.txt", "c.txt"}));
        queue->uploadAll();
        events.clear();

        queue->cancelAll();

        QCOMPARE(itemAt(0)->state(), UploadItem::State::Cancelled);
        QCOMPARE(itemAt(1)->state(), UploadItem::State::Queued);
        QVERIFY(!itemAt(1)->isReady());
        QVERIFY(!itemAt(2)->isReady());
        QVERIFY(!queue->isUploading());
        QCOMPARE(mock->mockGetRequests().size(), 1);
        QCOMPARE(events, QStringList({"cancelled:a.txt", "complete:a.txt", "finished", "cancel"}));
    }

    void testCancelAllWhenIdle()
    {
        queue->setOptions(recordingOptions());
        queue->add(QStringList{makeFile("a.txt")});
        events.clear();

        queue->cancelAll();

        QCOMPARE(events, QStringList({"cancel"}));
        QVERIFY(mock->mockGetAbortRequests().isEmpty());
    }

    void testRetryAfterError()
    {
        queue->add(QStringList{makeFile("a.txt")});
        queue->uploadAll();
        mock->mockCompleteNext(503);
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Error);

        queue->uploadItem(ItemRef::atIndex(0));
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Uploading);
        QCOMPARE(itemAt(0)->status(), 0);  // Previous response cleared

        mock->mockCompleteNext(200);
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Success);
        QCOMPARE(mock->mockGetRequests().size(), 2);
    }

    void testRetryAfterCancel()
    {
        queue->add(QStringList{makeFile("a.txt")});
        queue->uploadAll();
        queue->cancelItem(ItemRef::atIndex(0));
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Cancelled);

        queue->uploadAll();
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Uploading);
        mock->mockCompleteNext(204);
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Success);
    }

    void testNoTransportFailsItem()
    {
        queue->setOptions(recordingOptions());
        queue->setTransport(nullptr);
        queue->add(QStringList{makeFile("a.txt")});
        events.clear();

        queue->uploadAll();

        QCOMPARE(itemAt(0)->state(), UploadItem::State::Error);
        QCOMPARE(itemAt(0)->response().errorString, QString("No upload transport"));
        QCOMPARE(events.last(), QString("finished"));
    }

    // ========== Scheduling ==========

    void testSingleTransferInFlight()
    {
        queue->add(makeFiles({"a.txt", "b.txt", "c.txt"}));

        queue->uploadAll();
        queue->uploadAll();
        QCOMPARE(mock->mockPendingCount(), 1);
        QCOMPARE(mock->mockGetRequests().size(), 1);

        mock->mockCompleteNext(200);
        mock->mockCompleteNext(200);
        mock->mockCompleteNext(200);

        QCOMPARE(mock->mockMaxConcurrent(), 1);
        QCOMPARE(mock->mockGetSentIds(),
                 QList<quint64>({itemAt(0)->id(), itemAt(1)->id(), itemAt(2)->id()}));
        QCOMPARE(queue->uploadedCount(), 3);
    }

    void testUploadAllSkipsUploadedItems()
    {
        queue->setOptions(recordingOptions());
        queue->add(QStringList{makeFile("a.txt")});
        queue->uploadAll();
        mock->mockCompleteNext(200);
        events.clear();

        queue->uploadAll();

        QVERIFY(events.isEmpty());
        QCOMPARE(mock->mockGetRequests().size(), 1);
    }

    void testUploadItemWaitsForCurrentTransfer()
    {
        queue->add(makeFiles({"a.txt", "b.txt", "c.txt"}));
        const quint64 firstId = itemAt(0)->id();
        const quint64 lastId = itemAt(2)->id();

        queue->uploadItem(ItemRef::atIndex(2));
        queue->uploadItem(ItemRef::forId(firstId));

        QCOMPARE(mock->mockGetSentIds(), QList<quint64>({lastId}));
        QVERIFY(itemAt(0)->isReady());
        QCOMPARE(queue->readyItems().size(), 1);

        mock->mockCompleteNext(200);
        QCOMPARE(mock->mockGetSentIds(), QList<quint64>({lastId, firstId}));

        // Unrequested item stays queued
        mock->mockCompleteNext(200);
        QCOMPARE(itemAt(1)->state(), UploadItem::State::Queued);
        QVERIFY(!queue->isUploading());
    }

    void testReadyItemsFollowInsertionOrder()
    {
        queue->add(makeFiles({"a.txt", "b.txt", "c.txt", "d.txt"}));

        queue->uploadItem(ItemRef::atIndex(3));
        queue->uploadItem(ItemRef::atIndex(2));
        queue->uploadItem(ItemRef::atIndex(0));

        const QList<const UploadItem*> ready = queue->readyItems();
        QCOMPARE(ready.size(), 2);
        QCOMPARE(ready[0]->file().name, QString("a.txt"));
        QCOMPARE(ready[1]->file().name, QString("c.txt"));

        mock->mockCompleteNext(200);
        QCOMPARE(mock->mockGetRequests().last().fileName, QString("a.txt"));
    }

    void testOnUploadStartRemovingItemSkipsIt()
    {
        UploaderOptions options;
        options.callbacks.onUploadStart = [this](const UploadItem &item) {
            if (item.file().name == "a.txt") {
                queue->removeFromQueue(ItemRef(item));
            }
        };
        queue->setOptions(options);
        queue->add(makeFiles({"a.txt", "b.txt"}));

        queue->uploadAll();

        QCOMPARE(queue->count(), 1);
        QCOMPARE(mock->mockGetRequests().size(), 1);
        QCOMPARE(mock->mockGetRequests().first().fileName, QString("b.txt"));
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Uploading);
    }

    // ========== Progress ==========

    void testProgressIsAveragedOverQueue()
    {
        queue->add(makeFiles({"a.txt", "b.txt"}));
        QSignalSpy spy(queue, &UploadQueue::progressChanged);

        queue->uploadAll();
        mock->mockProgress(50, 100);
        QCOMPARE(itemAt(0)->progress(), 50);
        QCOMPARE(queue->progress(), 25);

        mock->mockCompleteNext(200);
        mock->mockProgress(50, 100);
        QCOMPARE(queue->progress(), 75);

        mock->mockCompleteNext(200);
        QCOMPARE(queue->progress(), 100);

        QCOMPARE(spy.count(), 3);
        QCOMPARE(spy.at(0).at(0).toInt(), 25);
        QCOMPARE(spy.at(1).at(0).toInt(), 75);
        QCOMPARE(spy.at(2).at(0).toInt(), 100);
    }

    void testProgressWithUnknownTotal()
    {
        QList<int> reported;
        UploaderOptions options;
        options.callbacks.onUploadProgress = [&reported](const UploadItem &, int progress, int) {
            reported << progress;
        };
        queue->setOptions(options);
        queue->add(QStringList{makeFile("a.txt")});

        queue->uploadAll();
        mock->mockProgress(10, 0);

        QCOMPARE(reported, QList<int>({0}));
        QCOMPARE(itemAt(0)->progress(), 0);
    }

    void testProgressForStaleItemIsIgnored()
    {
        queue->add(QStringList{makeFile("a.txt")});
        queue->uploadAll();

        emit mock->uploadProgress(9999, 50, 100);

        QCOMPARE(itemAt(0)->progress(), 0);
        QCOMPARE(queue->progress(), 0);
    }

    void testStaleFinishIsIgnored()
    {
        queue->add(QStringList{makeFile("a.txt")});
        queue->uploadAll();

        emit mock->uploadFinished(9999, TransferOutcome::Success, UploadResponse());

        QVERIFY(queue->isUploading());
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Uploading);
    }

    // ========== Removal ==========

    void testRemoveFromQueue()
    {
        queue->setOptions(recordingOptions());
        queue->add(makeFiles({"a.txt", "b.txt", "c.txt"}));
        events.clear();

        queue->removeFromQueue(ItemRef::atIndex(1));
        QCOMPARE(queue->count(), 2);
        QCOMPARE(itemAt(1)->file().name, QString("c.txt"));

        queue->removeFromQueue(ItemRef(*itemAt(1)));
        QCOMPARE(queue->count(), 1);
        QCOMPARE(events, QStringList({"dequeued:b.txt", "dequeued:c.txt"}));
    }

    void testRemovedItemIsDetached()
    {
        bool detached = false;
        UploaderOptions options;
        options.callbacks.onFileDequeued = [&detached](const UploadItem *item) {
            detached = item && item->queue() == nullptr;
        };
        queue->setOptions(options);
        queue->add(QStringList{makeFile("a.txt")});
        QCOMPARE(itemAt(0)->queue(), queue);

        queue->removeFromQueue(ItemRef::atIndex(0));

        QVERIFY(detached);
    }

    void testRemoveUploadingItemAbortsFirst()
    {
        queue->setOptions(recordingOptions());
        queue->add(makeFiles({"a.txt", "b.txt"}));
        queue->uploadAll();
        events.clear();

        queue->removeFromQueue(ItemRef::atIndex(0));

        QCOMPARE(queue->count(), 1);
        QCOMPARE(mock->mockGetAbortRequests().size(), 1);
        QCOMPARE(events, QStringList({"cancelled:a.txt", "complete:a.txt",
                                      "uploadStart:b.txt", "dequeued:a.txt"}));
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Uploading);
    }

    void testRemoveUploadingItemWithDeferredAbort()
    {
        queue->setOptions(recordingOptions());
        queue->add(makeFiles({"a.txt", "b.txt"}));
        queue->uploadAll();
        events.clear();

        mock->mockSetDeferAborts(true);
        const quint64 firstId = itemAt(0)->id();
        queue->removeFromQueue(ItemRef::atIndex(0));

        QCOMPARE(queue->count(), 1);
        QVERIFY(queue->isUploading());
        QCOMPARE(events, QStringList({"dequeued:a.txt"}));

        mock->mockFinishAbort(firstId);

        // The removed item gets no hooks, the next one starts
        QCOMPARE(events, QStringList({"dequeued:a.txt", "uploadStart:b.txt"}));
        QCOMPARE(mock->mockPendingCount(), 1);
    }

    void testRemoveAfterUpload()
    {
        UploaderOptions options = recordingOptions();
        options.removeAfterUpload = true;
        queue->setOptions(options);
        queue->add(makeFiles({"a.txt", "b.txt"}));
        events.clear();

        queue->uploadAll();
        mock->mockCompleteNext(200);

        QCOMPARE(queue->count(), 1);
        QCOMPARE(events.mid(0, 4), QStringList({"start", "uploadStart:a.txt",
                                                "success:a.txt:200", "dequeued:a.txt"}));
        QCOMPARE(events.at(4), QString("complete:a.txt"));

        mock->mockCompleteNext(200);
        QCOMPARE(queue->count(), 0);
        QCOMPARE(queue->progress(), 0);
        QCOMPARE(events.last(), QString("finished"));
    }

    void testFailedItemIsKeptWithRemoveAfterUpload()
    {
        UploaderOptions options;
        options.removeAfterUpload = true;
        queue->setOptions(options);
        queue->add(QStringList{makeFile("a.txt")});

        queue->uploadAll();
        mock->mockCompleteNext(400);

        QCOMPARE(queue->count(), 1);
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Error);
    }

    void testClearQueue()
    {
        queue->setOptions(recordingOptions());
        queue->add(makeFiles({"a.txt", "b.txt"}));
        queue->uploadAll();
        mock->mockProgress(50, 100);
        events.clear();

        queue->clearQueue();

        QCOMPARE(queue->count(), 0);
        QCOMPARE(queue->progress(), 0);
        QVERIFY(!queue->isUploading());
        // The waiting item was never sent
        QCOMPARE(mock->mockGetRequests().size(), 1);
        QCOMPARE(events.last(), QString("dequeued:all"));
        QVERIFY(events.contains("dequeued:a.txt"));
        QVERIFY(events.contains("dequeued:b.txt"));
        QVERIFY(!events.contains("uploadStart:b.txt"));
    }

    // ========== Configuration ==========

    void testSetOptionsUpdatesExistingItems()
    {
        UploaderOptions callSite;
        callSite.alias = "document";
        queue->add(QStringList{makeFile("a.txt")}, callSite);

        UploaderOptions update;
        update.url = QUrl("http://first.example.com/");
        queue->setOptions(update);

        QCOMPARE(itemAt(0)->config().url, QUrl("http://first.example.com/"));
        QCOMPARE(itemAt(0)->config().alias, QString("document"));

        update.url = QUrl("http://second.example.com/");
        queue->setOptions(update, false);

        QCOMPARE(itemAt(0)->config().url, QUrl("http://first.example.com/"));
        QCOMPARE(queue->config().url, QUrl("http://second.example.com/"));

        queue->add(QStringList{makeFile("b.txt")});
        QCOMPARE(itemAt(1)->config().url, QUrl("http://second.example.com/"));
    }

    void testRequestFields()
    {
        UploaderOptions options;
        options.url = QUrl("http://localhost:8080/files");
        options.method = "PUT";
        options.alias = "upload";
        options.withCredentials = false;
        options.disableMultipart = true;
        options.timeoutMs = 5000;
        options.params = QMap<QString, QString>{{"album", "holidays"}};
        options.headers = QList<UploadHeader>{{"X-Token", "secret"}};
        queue->setOptions(options);

        const QString path = makeFile("notes.txt");
        queue->add(QStringList{path});
        queue->uploadAll();

        QCOMPARE(mock->mockGetRequests().size(), 1);
        const UploadRequest request = mock->mockGetRequests().first();
        QCOMPARE(request.itemId, itemAt(0)->id());
        QCOMPARE(request.filePath, QFileInfo(path).absoluteFilePath());
        QCOMPARE(request.fileName, QString("notes.txt"));
        QCOMPARE(request.mimeType, QString("text/plain"));
        QCOMPARE(request.url, QUrl("http://localhost:8080/files"));
        QCOMPARE(request.method, QString("PUT"));
        QCOMPARE(request.alias, QString("upload"));
        QVERIFY(!request.withCredentials);
        QVERIFY(request.disableMultipart);
        QCOMPARE(request.timeoutMs, 5000);
        QCOMPARE(request.params.value("album"), QString("holidays"));
        QCOMPARE(request.headers.size(), 1);
        QCOMPARE(request.headers.first().name, QString("X-Token"));
    }

    void testTransformResponse()
    {
        QByteArray seenBody;
        QString seenHeader;

        UploaderOptions options;
        options.transformResponse = [](const QByteArray &body, const ResponseHeaders &headers) {
            return body.toUpper() + headers.value("x-id").toUtf8();
        };
        options.callbacks.onUploadSuccess = [&](const UploadItem &, const QByteArray &body,
                                                int, const ResponseHeaders &headers) {
            seenBody = body;
            seenHeader = headers.value("x-id");
        };
        queue->setOptions(options);
        queue->add(QStringList{makeFile("a.txt")});

        queue->uploadAll();
        mock->mockCompleteNext(200, "ok", ResponseHeaders{{"x-id", "7"}});

        QCOMPARE(seenBody, QByteArray("OK7"));
        QCOMPARE(seenHeader, QString("7"));
        QCOMPARE(itemAt(0)->response().body, QByteArray("OK7"));
    }

    // ========== Caller-supplied transport ==========

    void testCustomTransport()
    {
        UploadDoneCallback pendingDone;
        QStringList sentNames;

        UploaderOptions options = recordingOptions();
        options.uploadTransport = [&](const UploadItem &item, UploadDoneCallback done) {
            sentNames << item.file().name;
            pendingDone = done;
        };
        options.transformResponse = [](const QByteArray &body, const ResponseHeaders &) {
            return body.toUpper();
        };
        queue->setOptions(options);
        queue->add(makeFiles({"a.txt", "b.txt"}));
        events.clear();

        queue->uploadAll();
        QCOMPARE(sentNames, QStringList({"a.txt"}));
        QCOMPARE(mock->mockGetRequests().size(), 0);

        // Completing starts the next item, which replaces pendingDone
        UploadDoneCallback done = pendingDone;
        done("custom");

        QCOMPARE(itemAt(0)->state(), UploadItem::State::Success);
        QCOMPARE(itemAt(0)->status(), 0);
        QCOMPARE(itemAt(0)->response().body, QByteArray("custom"));
        QCOMPARE(sentNames, QStringList({"a.txt", "b.txt"}));

        // Repeated completion is ignored
        done("again");
        QCOMPARE(itemAt(1)->state(), UploadItem::State::Uploading);
        QCOMPARE(events.count("success:a.txt:0"), 1);

        done = pendingDone;
        done("second");
        QCOMPARE(itemAt(1)->state(), UploadItem::State::Success);
        QCOMPARE(events.last(), QString("finished"));
    }

    void testCustomTransportIsNotReadChecked()
    {
        UploadDoneCallback pendingDone;
        UploaderOptions options;
        options.uploadTransport = [&pendingDone](const UploadItem &, UploadDoneCallback done) {
            pendingDone = done;
        };
        queue->setOptions(options);

        const QString path = makeFile("gone.txt");
        queue->add(QStringList{path});
        QFile::remove(path);

        queue->uploadAll();
        QVERIFY(queue->isUploading());
        UploadDoneCallback done = pendingDone;
        done(QByteArray());
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Success);
    }

    void testCustomTransportCannotBeCancelled()
    {
        UploadDoneCallback pendingDone;
        UploaderOptions options;
        options.uploadTransport = [&pendingDone](const UploadItem &, UploadDoneCallback done) {
            pendingDone = done;
        };
        queue->setOptions(options);
        queue->add(QStringList{makeFile("a.txt")});
        queue->uploadAll();

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("cannot be aborted"));
        queue->cancelItem(ItemRef::atIndex(0));

        QCOMPARE(itemAt(0)->state(), UploadItem::State::Uploading);
        QVERIFY(mock->mockGetAbortRequests().isEmpty());

        UploadDoneCallback done = pendingDone;
        done("late");
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Success);
    }

    // ========== Invalid files ==========

    void testUploadItemThrowsForMissingFile()
    {
        const QString path = makeFile("vanished.txt");
        queue->add(QStringList{path});
        QFile::remove(path);

        bool thrown = false;
        try {
            queue->uploadItem(ItemRef::atIndex(0));
        } catch (const InvalidFileError &e) {
            thrown = true;
            QCOMPARE(e.path(), QFileInfo(path).absoluteFilePath());
        }

        QVERIFY(thrown);
        QVERIFY(!itemAt(0)->isReady());
        QVERIFY(!queue->isUploading());
        QCOMPARE(mock->mockGetRequests().size(), 0);
    }

    void testFileMissingAtAdmissionStaysInvalid()
    {
        const QString path = tempDir.filePath("late.txt");
        queue->add(QStringList{path});
        QCOMPARE(queue->count(), 1);
        QCOMPARE(itemAt(0)->file().size, qint64(-1));

        // Created after admission: the snapshot still has no valid size
        makeFile("late.txt");

        bool thrown = false;
        try {
            queue->uploadItem(ItemRef::atIndex(0));
        } catch (const InvalidFileError &) {
            thrown = true;
        }

        QVERIFY(thrown);
        QCOMPARE(mock->mockGetRequests().size(), 0);
    }

    void testUploadAllThrowsForMissingFirstFile()
    {
        const QString path = makeFile("first.txt");
        queue->add(QStringList{path, makeFile("second.txt")});
        QFile::remove(path);

        bool thrown = false;
        try {
            queue->uploadAll();
        } catch (const InvalidFileError &) {
            thrown = true;
        }

        QVERIFY(thrown);
        QVERIFY(!queue->isUploading());
        QCOMPARE(itemAt(0)->state(), UploadItem::State::Queued);
    }

    void testMissingFileDuringCascadeFailsItem()
    {
        queue->setOptions(recordingOptions());
        const QString middle = makeFile("b.txt");
        queue->add(QStringList{makeFile("a.txt"), middle, makeFile("c.txt")});
        queue->uploadAll();
        QFile::remove(middle);
        events.clear();

        mock->mockCompleteNext(200);

        QCOMPARE(itemAt(1)->state(), UploadItem::State::Error);
        QVERIFY(itemAt(1)->response().errorString.contains("b.txt"));
        QCOMPARE(itemAt(2)->state(), UploadItem::State::Uploading);
        QCOMPARE(events, QStringList({"success:a.txt:200", "complete:a.txt",
                                      "error:b.txt:0", "complete:b.txt", "uploadStart:c.txt"}));
        QCOMPARE(mock->mockMaxConcurrent(), 1);
    }

    // ========== Item references ==========

    void testItemConvenienceMethods()
    {
        queue->add(makeFiles({"a.txt", "b.txt"}));
        const UploadItem *first = itemAt(0);

        first->upload();
        QCOMPARE(first->state(), UploadItem::State::Uploading);

        first->cancel();
        QCOMPARE(first->state(), UploadItem::State::Cancelled);

        first->remove();
        QCOMPARE(queue->count(), 1);
        QCOMPARE(itemAt(0)->file().name, QString("b.txt"));
    }

    void testInvalidItemRefIsIgnored()
    {
        queue->add(QStringList{makeFile("a.txt")});

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("no item at row 5"));
        queue->uploadItem(ItemRef::atIndex(5));

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("no item at id 9999"));
        QVERIFY(queue->item(ItemRef::forId(9999)) == nullptr);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("no item at row -1"));
        queue->removeFromQueue(ItemRef::atIndex(-1));

        QCOMPARE(queue->count(), 1);
        QVERIFY(!queue->isUploading());
    }

    // ========== Model interface ==========

    void testModelData()
    {
        const QString path = makeFile("photo.txt", 42);
        queue->add(QStringList{path});

        QCOMPARE(queue->rowCount(), 1);
        const QModelIndex index = queue->index(0);
        QCOMPARE(queue->data(index, Qt::DisplayRole).toString(), QString("photo.txt"));
        QCOMPARE(queue->data(index, UploadQueue::FilePathRole).toString(),
                 QFileInfo(path).absoluteFilePath());
        QCOMPARE(queue->data(index, UploadQueue::FileSizeRole).toLongLong(), 42LL);
        QCOMPARE(queue->data(index, UploadQueue::StateRole).toInt(),
                 static_cast<int>(UploadItem::State::Queued));
        QCOMPARE(queue->data(index, UploadQueue::ReadyRole).toBool(), false);

        queue->uploadAll();
        mock->mockCompleteNext(500);

        QCOMPARE(queue->data(index, UploadQueue::StatusCodeRole).toInt(), 500);
        QCOMPARE(queue->data(index, UploadQueue::StateRole).toInt(),
                 static_cast<int>(UploadItem::State::Error));
        QVERIFY(!queue->data(queue->index(3), Qt::DisplayRole).isValid());

        const QHash<int, QByteArray> roles = queue->roleNames();
        QCOMPARE(roles.value(UploadQueue::ProgressRole), QByteArray("progress"));
        QCOMPARE(roles.value(UploadQueue::IdRole), QByteArray("itemId"));
    }

    void testItemStateChangedSignal()
    {
        queue->add(QStringList{makeFile("a.txt")});
        QSignalSpy spy(queue, &UploadQueue::itemStateChanged);

        queue->uploadAll();
        mock->mockCompleteNext(200);

        QCOMPARE(spy.count(), 2);
        QCOMPARE(spy.at(0).at(1).value<UploadItem::State>(), UploadItem::State::Uploading);
        QCOMPARE(spy.at(1).at(0).value<quint64>(), itemAt(0)->id());
        QCOMPARE(spy.at(1).at(1).value<UploadItem::State>(), UploadItem::State::Success);
    }

    void testQueueChangedSignal()
    {
        QSignalSpy spy(queue, &UploadQueue::queueChanged);

        queue->add(makeFiles({"a.txt", "b.txt"}));
        QCOMPARE(spy.count(), 1);

        queue->removeFromQueue(ItemRef::atIndex(0));
        QCOMPARE(spy.count(), 2);
    }

    // ========== Construction ==========

    void testDestructorAbortsInFlightTransfer()
    {
        queue->add(QStringList{makeFile("a.txt")});
        queue->uploadAll();
        const quint64 id = itemAt(0)->id();

        delete queue;
        queue = nullptr;

        QCOMPARE(mock->mockGetAbortRequests(), QList<quint64>({id}));
    }

    void testQueueDeletedFromFinishedHook()
    {
        UploaderOptions options = recordingOptions();
        options.callbacks.onFinished = [this]() {
            events << "finished";
            delete queue;
            queue = nullptr;
        };
        queue->setOptions(options);
        queue->add(makeFiles({"a.txt", "b.txt"}));
        queue->uploadAll();

        mock->mockCompleteNext(200);
        mock->mockCompleteNext(200);

        QVERIFY(queue == nullptr);
        QCOMPARE(events.last(), QString("finished"));
        QCOMPARE(mock->mockGetRequests().size(), 2);
    }

    void testGlobalOptionsConstructor()
    {
        UploaderOptions global;
        global.method = "PUT";
        global.alias = "global";

        UploaderOptions instance;
        instance.alias = "instance";

        UploadQueue configured(instance, global);

        QCOMPARE(configured.config().method, QString("PUT"));
        QCOMPARE(configured.config().alias, QString("instance"));
        QVERIFY(qobject_cast<HttpUploadTransport*>(configured.transport()) != nullptr);
    }
};

QTEST_MAIN(TestUploadQueue)
#include "test_uploadqueue.moc"
