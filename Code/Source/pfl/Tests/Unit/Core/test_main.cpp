/**
 * @file test_main.cpp
 * @brief Main entry point for running all Core module unit tests
 */

#include <gtest/gtest.h>
#include <chrono>
#include <iostream>

class CoreTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "========================================\n";
        std::cout << "PhysFields Core Module Unit Tests\n";
        std::cout << "========================================\n";
        start_time = std::chrono::high_resolution_clock::now();
    }

    void TearDown() override {
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        std::cout << "========================================\n";
        std::cout << "Total test execution time: " << duration.count() << " ms\n";
        std::cout << "========================================\n";
    }

private:
    std::chrono::high_resolution_clock::time_point start_time;
};

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new CoreTestEnvironment);
    return RUN_ALL_TESTS();
}
