#include <gtest/gtest.h>
#include <PixOps/PixOps.h>

#include <iostream>

int main(int argc, char** argv) {
    // Print library info
    std::cout << "========================================\n";
    std::cout << "PixOps Unit Tests\n";
    std::cout << "Version: " << Pix::Ops::GetVersion() << "\n";
    std::cout << "========================================\n\n";

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
