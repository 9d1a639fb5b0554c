#include "app/ChangeGate.hpp"

#include <gtest/gtest.h>

#include <sstream>

TEST(ChangeGateTest, DryRunDescribesAndRefuses) {
    std::istringstream in("s\n");
    std::ostringstream out;
    ChangeGate gate(true, true, in, out);

    EXPECT_FALSE(gate.shouldProcess("eth0", "Reiniciar adaptador"));
    EXPECT_NE(out.str().find("[SIMULAÇÃO] Reiniciar adaptador em eth0"), std::string::npos);
    // Em simulação nada é perguntado.
    std::string left;
    std::getline(in, left);
    EXPECT_EQ(left, "s");
}

TEST(ChangeGateTest, WithoutConfirmationEverythingProceeds) {
    std::istringstream in;
    std::ostringstream out;
    ChangeGate gate(false, false, in, out);

    EXPECT_TRUE(gate.shouldProcess("eth0", "Reiniciar adaptador"));
    EXPECT_TRUE(out.str().empty());
}

TEST(ChangeGateTest, ConfirmationAcceptsYesAnswers) {
    std::istringstream in("s\n  Y\nsim\n");
    std::ostringstream out;
    ChangeGate gate(false, true, in, out);

    EXPECT_TRUE(gate.shouldProcess("eth0", "a"));
    EXPECT_TRUE(gate.shouldProcess("eth0", "b"));
    EXPECT_TRUE(gate.shouldProcess("eth0", "c"));
}

TEST(ChangeGateTest, AnythingElseIsADecline) {
    std::istringstream in("n\n\nquit\n");
    std::ostringstream out;
    ChangeGate gate(false, true, in, out);

    EXPECT_FALSE(gate.shouldProcess("eth0", "a"));
    EXPECT_FALSE(gate.shouldProcess("eth0", "b"));
    EXPECT_FALSE(gate.shouldProcess("eth0", "c"));
    EXPECT_NE(out.str().find("tratado como simulação"), std::string::npos);
}

TEST(ChangeGateTest, ClosedInputIsADecline) {
    std::istringstream in;
    std::ostringstream out;
    ChangeGate gate(false, true, in, out);

    EXPECT_FALSE(gate.shouldProcess("host", "Reiniciar o host"));
}
