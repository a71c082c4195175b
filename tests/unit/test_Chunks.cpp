#include <gtest/gtest.h>
#include "lo/ChunkReader.hpp"
#include "lo/ChunkWriter.hpp"
#include "lo/ChunkView.hpp"
#include "lo/ChunkSink.hpp"
#include "lo/ChunkSource.hpp"
#include "lo/Error.hpp"
#include "MemoryBackend.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pglo::lo;
using pglo::test::MemoryBackend;

namespace {

std::string str(const Bytes& b) { return {b.begin(), b.end()}; }

Bytes bytes(const std::string& s) { return {s.begin(), s.end()}; }

std::vector<std::string> drain(ChunkSource& source) {
    std::vector<std::string> out;
    for (const auto& chunk : source) out.push_back(str(chunk));
    return out;
}

}

class ChunkReaderTest : public ::testing::Test {
protected:
    MemoryBackend backend;
};

TEST_F(ChunkReaderTest, YieldsBufferSizedChunks) {
    const auto oid = backend.put("ABCDEFG");
    ChunkReader reader(LargeObject::open(backend, oid, Mode::Read, 3));

    EXPECT_EQ(drain(reader), (std::vector<std::string>{"ABC", "DEF", "G"}));
    EXPECT_TRUE(reader.done());
    EXPECT_TRUE(reader.object().closed());
    EXPECT_EQ(backend.openDescriptors(), 0u);
}

TEST_F(ChunkReaderTest, OneReadPerPull) {
    const auto oid = backend.put("ABCDEF");
    ChunkReader reader(LargeObject::open(backend, oid, Mode::Read, 2));
    backend.clearCalls();

    auto first = reader.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(str(*first), "AB");
    EXPECT_EQ(backend.callCount("read"), 1u);

    (void)reader.next();
    EXPECT_EQ(backend.callCount("read"), 2u);
}

TEST_F(ChunkReaderTest, ExactMultipleEndsOnEmptyRead) {
    const auto oid = backend.put("ABCDEF");
    ChunkReader reader(LargeObject::open(backend, oid, Mode::Read, 3));
    backend.clearCalls();

    EXPECT_EQ(drain(reader).size(), 2u);
    EXPECT_EQ(backend.callCount("read"), 3u);
    EXPECT_EQ(backend.callCount("close"), 1u);
}

TEST_F(ChunkReaderTest, EmptyObjectYieldsNothing) {
    const auto oid = backend.put("");
    ChunkReader reader(LargeObject::open(backend, oid, Mode::Read, 4));
    EXPECT_TRUE(drain(reader).empty());
    EXPECT_FALSE(reader.next());
}

TEST_F(ChunkReaderTest, StartsAtCurrentCursor) {
    const auto oid = backend.put("ABCDEFG");
    auto lob = LargeObject::open(backend, oid, Mode::Read, 4);
    lob.seek(5);
    ChunkReader reader(std::move(lob));
    EXPECT_EQ(drain(reader), (std::vector<std::string>{"FG"}));
}

TEST_F(ChunkReaderTest, CancelClosesWithoutFurtherReads) {
    const auto oid = backend.put("ABCDEFG");
    ChunkReader reader(LargeObject::open(backend, oid, Mode::Read, 2));

    ASSERT_TRUE(reader.next());
    backend.clearCalls();

    reader.cancel();
    EXPECT_EQ(backend.callCount("read"), 0u);
    EXPECT_EQ(backend.callCount("close"), 1u);
    EXPECT_FALSE(reader.next());
    EXPECT_EQ(backend.openDescriptors(), 0u);
}

TEST_F(ChunkReaderTest, DestructionClosesEarlyStoppedReader) {
    const auto oid = backend.put("ABCDEFG");
    {
        ChunkReader reader(LargeObject::open(backend, oid, Mode::Read, 2));
        ASSERT_TRUE(reader.next());
    }
    EXPECT_EQ(backend.openDescriptors(), 0u);
}

TEST_F(ChunkReaderTest, ReadFailurePropagatesAndCloses) {
    const auto oid = backend.put("ABCDEFG");
    ChunkReader reader(LargeObject::open(backend, oid, Mode::Read, 2));
    backend.failOn("read", 2, ErrorKind::Backend);

    ASSERT_TRUE(reader.next());
    EXPECT_THROW((void)reader.next(), Error);
    EXPECT_TRUE(reader.done());
    EXPECT_EQ(backend.openDescriptors(), 0u);
}

class ChunkWriterTest : public ::testing::Test {
protected:
    MemoryBackend backend;
};

TEST_F(ChunkWriterTest, OneWritePerChunk) {
    ChunkWriter writer(LargeObject::create(backend, Mode::Write));
    backend.clearCalls();

    writer.write(bytes("A"));
    writer.write(bytes("BCDEFGHIJK"));
    writer.write(bytes(""));
    writer.finish();

    EXPECT_EQ(backend.callCount("write"), 3u);
    EXPECT_EQ(writer.chunkCount(), 3u);
    EXPECT_EQ(writer.bytesWritten(), 11u);
    EXPECT_TRUE(writer.finished());
    EXPECT_EQ(backend.text(writer.oid()), "ABCDEFGHIJK");
    EXPECT_EQ(backend.openDescriptors(), 0u);
}

TEST_F(ChunkWriterTest, WriteAfterFinishIsLogicError) {
    ChunkWriter writer(LargeObject::create(backend, Mode::Write));
    writer.finish();
    EXPECT_THROW(writer.write(bytes("X")), std::logic_error);
}

TEST_F(ChunkWriterTest, FinishPropagatesCloseFailure) {
    ChunkWriter writer(LargeObject::create(backend, Mode::Write));
    backend.failOn("close", 1, ErrorKind::Backend);
    EXPECT_THROW(writer.finish(), Error);
}

TEST_F(ChunkWriterTest, AbortSwallowsCloseFailure) {
    ChunkWriter writer(LargeObject::create(backend, Mode::Write));
    backend.failOn("close", 1, ErrorKind::Backend);
    EXPECT_NO_THROW(writer.abort());
    EXPECT_TRUE(writer.finished());
}

TEST_F(ChunkWriterTest, DestructionWithoutFinishCloses) {
    {
        ChunkWriter writer(LargeObject::create(backend, Mode::Write));
        writer.write(bytes("partial"));
    }
    EXPECT_EQ(backend.openDescriptors(), 0u);
}

TEST_F(ChunkWriterTest, ReadOnlyObjectRejectsChunks) {
    const auto oid = backend.put("ABC");
    ChunkWriter writer(LargeObject::open(backend, oid, Mode::Read));

    try {
        writer.write(bytes("X"));
        FAIL() << "write through read-only handle succeeded";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ReadOnly);
    }
    EXPECT_EQ(writer.chunkCount(), 0u);
}

class ChunkViewTest : public ::testing::Test {
protected:
    MemoryBackend backend;
};

TEST_F(ChunkViewTest, CountRoundsUp) {
    const auto oid = backend.put("ABCDEFG");
    auto lob = LargeObject::open(backend, oid, Mode::Read, 3);
    EXPECT_EQ(ChunkView(lob).count(), 3u);

    auto exact = LargeObject::open(backend, backend.put("ABCDEF"), Mode::Read, 3);
    EXPECT_EQ(ChunkView(exact).count(), 2u);

    auto empty = LargeObject::open(backend, backend.put(""), Mode::Read, 3);
    EXPECT_EQ(ChunkView(empty).count(), 0u);
}

TEST_F(ChunkViewTest, IndexedAccessIgnoresCursor) {
    const auto oid = backend.put("ABCDEFG");
    auto lob = LargeObject::open(backend, oid, Mode::Read, 3);
    lob.seek(4);

    ChunkView view(lob);
    EXPECT_EQ(str(view.at(0)), "ABC");
    EXPECT_EQ(str(view.at(2)), "G");
    EXPECT_EQ(str(view.at(1)), "DEF");
}

TEST_F(ChunkViewTest, OutOfRange) {
    const auto oid = backend.put("ABCDEFG");
    auto lob = LargeObject::open(backend, oid, Mode::Read, 3);
    ChunkView view(lob);

    EXPECT_THROW((void)view.at(3), std::out_of_range);
    EXPECT_THROW((void)view.slice(2, 2), std::out_of_range);
}

TEST_F(ChunkViewTest, SliceWithStep) {
    const auto oid = backend.put("AABBCCDDEE");
    auto lob = LargeObject::open(backend, oid, Mode::Read, 2);
    ChunkView view(lob);

    std::vector<std::string> got;
    for (const auto& c : view.slice(0, 3, 2)) got.push_back(str(c));
    EXPECT_EQ(got, (std::vector<std::string>{"AA", "CC", "EE"}));

    got.clear();
    for (const auto& c : view.slice(1, 2)) got.push_back(str(c));
    EXPECT_EQ(got, (std::vector<std::string>{"BB", "CC"}));

    EXPECT_TRUE(view.slice(0, 0).empty());
    EXPECT_THROW((void)view.slice(0, 1, 0), std::invalid_argument);
}

TEST(ChunkStreamsTest, BufferSourceRechunks) {
    const auto data = bytes("ABCDEFG");
    BufferSource source(data, 3);
    EXPECT_EQ(drain(source), (std::vector<std::string>{"ABC", "DEF", "G"}));
    EXPECT_FALSE(source.next());
}

TEST(ChunkStreamsTest, BufferSourceEmptyBuffer) {
    const Bytes data;
    BufferSource source(data, 3);
    EXPECT_TRUE(drain(source).empty());
}

TEST(ChunkStreamsTest, StreamSourceReadsUntilEof) {
    std::istringstream in("ABCDEFGH");
    StreamSource source(in, 5);
    EXPECT_EQ(drain(source), (std::vector<std::string>{"ABCDE", "FGH"}));
}

TEST(ChunkStreamsTest, ZeroChunkSizeRejected) {
    const auto data = bytes("A");
    std::istringstream in("A");
    EXPECT_THROW(BufferSource(data, 0), std::invalid_argument);
    EXPECT_THROW(StreamSource(in, 0), std::invalid_argument);
}

TEST(ChunkStreamsTest, SinksCollectChunks) {
    BufferSink buffer;
    buffer.write(bytes("AB"));
    buffer.write(bytes("C"));
    EXPECT_EQ(str(buffer.data()), "ABC");
    EXPECT_EQ(str(buffer.take()), "ABC");

    std::ostringstream out;
    StreamSink stream(out);
    stream.write(bytes("XY"));
    stream.finish();
    EXPECT_EQ(out.str(), "XY");

    size_t calls = 0;
    CallbackSink callback([&](std::span<const uint8_t> chunk) { calls += chunk.size() > 0; });
    callback.write(bytes("1"));
    callback.write(bytes("2"));
    EXPECT_EQ(calls, 2u);
}
