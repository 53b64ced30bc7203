// tests/file_splitter_test.cpp
#include <gtest/gtest.h>

#include <limits>

#include "file_splitter.hpp"
#include "test_helpers.hpp"
#include "upload_errors.hpp"

namespace fs = std::filesystem;

namespace MultipartUploader {
namespace Pieces {
namespace test {

class FileSplitterTest : public Testing::StoreTest {
protected:
    fs::path piecesDir() {
        fs::path dir = workdir() / "pieces";
        fs::create_directories(dir);
        return dir;
    }
};

TEST_F(FileSplitterTest, FiftyBytesInTwentyBytePieces) {
    fs::path source = workdir() / "small_testfile";
    Testing::writeFile(source, Testing::SMALL_TESTFILE_CONTENT);

    std::vector<FilePiece> pieces = FileSplitter::split(source, piecesDir(), 20);

    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(fs::file_size(pieces[0].path), 20u);
    EXPECT_EQ(fs::file_size(pieces[1].path), 20u);
    EXPECT_EQ(fs::file_size(pieces[2].path), 10u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(pieces[i].index, i + 1);
        EXPECT_EQ(pieces[i].offset, static_cast<uint64_t>(i) * 20);
        EXPECT_EQ(pieces[i].size, fs::file_size(pieces[i].path));
    }
    EXPECT_EQ(pieces[0].path.filename().string(), "small_testfile.1");
    EXPECT_EQ(pieces[2].path.filename().string(), "small_testfile.3");
}

TEST_F(FileSplitterTest, PiecesReassembleToSource) {
    fs::path source = workdir() / "data.bin";
    std::vector<char> data = Testing::randomBytes(100 * 1024 + 7);
    Testing::writeFile(source, data);

    std::vector<FilePiece> pieces = FileSplitter::split(source, piecesDir(), 4096);

    uint64_t total = 0;
    std::vector<char> reassembled;
    for (size_t i = 0; i < pieces.size(); ++i) {
        EXPECT_LE(pieces[i].size, 4096u);
        if (i + 1 < pieces.size()) {
            EXPECT_EQ(pieces[i].size, 4096u);
        }
        EXPECT_GT(pieces[i].size, 0u);
        std::vector<char> bytes = pieces[i].loadData();
        reassembled.insert(reassembled.end(), bytes.begin(), bytes.end());
        total += pieces[i].size;
    }
    EXPECT_EQ(total, data.size());
    EXPECT_EQ(reassembled, data);
}

TEST_F(FileSplitterTest, IndexIsZeroPaddedToPieceCountWidth) {
    fs::path source = workdir() / "twelve";
    Testing::writeFile(source, std::string(120, 'x'));

    std::vector<FilePiece> pieces = FileSplitter::split(source, piecesDir(), 10);

    ASSERT_EQ(pieces.size(), 12u);
    EXPECT_EQ(pieces.front().path.filename().string(), "twelve.01");
    EXPECT_EQ(pieces[8].path.filename().string(), "twelve.09");
    EXPECT_EQ(pieces.back().path.filename().string(), "twelve.12");
    for (size_t i = 1; i < pieces.size(); ++i) {
        EXPECT_LT(pieces[i - 1].path.filename().string(), pieces[i].path.filename().string());
    }
}

TEST_F(FileSplitterTest, ExactMultipleHasNoShortPiece) {
    fs::path source = workdir() / "forty";
    Testing::writeFile(source, std::string(40, 'y'));

    std::vector<FilePiece> pieces = FileSplitter::split(source, piecesDir(), 20);

    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[1].size, 20u);
}

TEST_F(FileSplitterTest, PieceSizeLargerThanFileGivesOnePiece) {
    fs::path source = workdir() / "small_testfile";
    Testing::writeFile(source, Testing::SMALL_TESTFILE_CONTENT);

    std::vector<FilePiece> pieces = FileSplitter::split(source, piecesDir(), 1024);

    ASSERT_EQ(pieces.size(), 1u);
    EXPECT_EQ(pieces[0].size, 50u);
    EXPECT_EQ(pieces[0].path.filename().string(), "small_testfile.1");
}

TEST_F(FileSplitterTest, EmptySourceGivesNoPieces) {
    fs::path source = workdir() / "empty";
    Testing::writeFile(source, std::string());

    EXPECT_TRUE(FileSplitter::split(source, piecesDir(), 20).empty());
}

TEST_F(FileSplitterTest, PieceCount) {
    EXPECT_EQ(FileSplitter::pieceCount(0, 20), 0u);
    EXPECT_EQ(FileSplitter::pieceCount(1, 20), 1u);
    EXPECT_EQ(FileSplitter::pieceCount(20, 20), 1u);
    EXPECT_EQ(FileSplitter::pieceCount(21, 20), 2u);
    EXPECT_THROW(FileSplitter::pieceCount(21, 0), InvalidInput);
}

TEST_F(FileSplitterTest, PieceSizeNearSizeMaxDoesNotWrap) {
    const size_t huge = std::numeric_limits<size_t>::max();
    EXPECT_EQ(FileSplitter::pieceCount(50, huge), 1u);
    EXPECT_EQ(FileSplitter::pieceCount(50, huge - 10), 1u);

    fs::path source = workdir() / "small_testfile";
    Testing::writeFile(source, Testing::SMALL_TESTFILE_CONTENT);

    std::vector<FilePiece> pieces = FileSplitter::split(source, piecesDir(), huge);

    ASSERT_EQ(pieces.size(), 1u);
    EXPECT_EQ(pieces[0].size, 50u);
    EXPECT_EQ(Testing::readFile(pieces[0].path),
              std::vector<char>(Testing::SMALL_TESTFILE_CONTENT.begin(), Testing::SMALL_TESTFILE_CONTENT.end()));
}

TEST_F(FileSplitterTest, ZeroPieceSizeIsRejected) {
    fs::path source = workdir() / "small_testfile";
    Testing::writeFile(source, Testing::SMALL_TESTFILE_CONTENT);

    EXPECT_THROW(FileSplitter::split(source, piecesDir(), 0), InvalidInput);
}

TEST_F(FileSplitterTest, MissingSourceIsIOError) {
    EXPECT_THROW(FileSplitter::split(workdir() / "missing", piecesDir(), 20), IOError);
}

TEST_F(FileSplitterTest, UnwritableDestinationIsIOError) {
    fs::path source = workdir() / "small_testfile";
    Testing::writeFile(source, Testing::SMALL_TESTFILE_CONTENT);

    EXPECT_THROW(FileSplitter::split(source, workdir() / "no" / "such" / "dir", 20), IOError);
}

} // namespace test
} // namespace Pieces
} // namespace MultipartUploader
