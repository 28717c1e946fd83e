#include <gtest/gtest.h>
#include "UsbIdDatabase.hpp"

namespace hubscope {
namespace testing {

namespace {

const char* SAMPLE =
    "# usb.ids excerpt\n"
    "05e3  Genesys Logic, Inc.\n"
    "\t0610  Hub\n"
    "\t0626  Hub\n"
    "\t\t00  interface line\n"
    "046d  Logitech, Inc.\n"
    "\tc52b  Unifying Receiver\n"
    "\n"
    "C 09  Hub\n"
    "\t00  Unused\n";

} // namespace

TEST(UsbIdDatabaseTest, ParsesVendorsAndProducts) {
    UsbIdDatabase db;
    db.parse(SAMPLE);

    EXPECT_TRUE(db.isLoaded());
    EXPECT_EQ(db.vendorCount(), 2u);
    EXPECT_EQ(db.vendorName("05e3"), "Genesys Logic, Inc.");
    EXPECT_EQ(db.productName("05e3", "0610"), "Hub");
    EXPECT_EQ(db.productName("046d", "c52b"), "Unifying Receiver");
}

TEST(UsbIdDatabaseTest, ClassSectionDoesNotLeakIntoVendors) {
    UsbIdDatabase db;
    db.parse(SAMPLE);
    EXPECT_EQ(db.productName("046d", "00"), "");
    EXPECT_EQ(db.vendorName("C 09"), "");
}

TEST(UsbIdDatabaseTest, UnknownIdsResolveEmpty) {
    UsbIdDatabase db;
    EXPECT_FALSE(db.isLoaded());
    EXPECT_EQ(db.vendorName("ffff"), "");
    EXPECT_EQ(db.productName("ffff", "0001"), "");
}

TEST(UsbIdDatabaseTest, MissingFileFailsToLoad) {
    UsbIdDatabase db;
    EXPECT_FALSE(db.load("/nonexistent/usb.ids"));
}

} // namespace testing
} // namespace hubscope
