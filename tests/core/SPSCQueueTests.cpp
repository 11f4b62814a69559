#include <catch2/catch_test_macros.hpp>
#include "core/SPSCQueue.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <thread>
#include <vector>

using klang::SPSCQueue;

TEST_CASE("SPSCQueue: fresh queue is empty")
{
    SPSCQueue<int, 4> q;
    REQUIRE(q.empty());
    REQUIRE(q.size() == 0);
    int out = 99;
    REQUIRE_FALSE(q.tryPop(out));
    REQUIRE(out == 99);
}

TEST_CASE("SPSCQueue: holds exactly its capacity")
{
    SPSCQueue<int, 4> q;
    STATIC_REQUIRE(SPSCQueue<int, 4>::capacity() == 4);
    for (int i = 0; i < 4; ++i)
        REQUIRE(q.tryPush(i));
    REQUIRE(q.size() == 4);
    REQUIRE_FALSE(q.tryPush(4));
}

TEST_CASE("SPSCQueue: FIFO across wraparound")
{
    SPSCQueue<int, 3> q;
    int out;

    for (int round = 0; round < 5; ++round)
    {
        REQUIRE(q.tryPush(round * 10 + 1));
        REQUIRE(q.tryPush(round * 10 + 2));
        q.tryPop(out); REQUIRE(out == round * 10 + 1);
        REQUIRE(q.tryPush(round * 10 + 3));
        q.tryPop(out); REQUIRE(out == round * 10 + 2);
        q.tryPop(out); REQUIRE(out == round * 10 + 3);
        REQUIRE(q.empty());
    }
}

TEST_CASE("SPSCQueue: drain hands items over oldest first")
{
    SPSCQueue<int, 8> q;
    q.tryPush(3);
    q.tryPush(1);
    q.tryPush(2);

    std::vector<int> seen;
    REQUIRE(q.drain([&seen](int v) { seen.push_back(v); }) == 3);
    REQUIRE(seen == std::vector<int>{3, 1, 2});
    REQUIRE(q.empty());
    REQUIRE(q.drain([](int) {}) == 0);
}

TEST_CASE("SPSCQueue: reset discards queued items")
{
    SPSCQueue<int, 4> q;
    q.tryPush(1);
    q.tryPush(2);
    q.reset();
    REQUIRE(q.empty());

    REQUIRE(q.tryPush(10));
    int out;
    REQUIRE(q.tryPop(out));
    REQUIRE(out == 10);
}

TEST_CASE("SPSCQueue: carries MIDI messages intact")
{
    SPSCQueue<juce::MidiMessage, 4> q;
    REQUIRE(q.tryPush(juce::MidiMessage::noteOn(1, 60, (juce::uint8) 100)));
    REQUIRE(q.tryPush(juce::MidiMessage::noteOff(1, 60)));

    juce::MidiMessage out;
    REQUIRE(q.tryPop(out));
    REQUIRE(out.isNoteOn());
    REQUIRE(out.getNoteNumber() == 60);
    REQUIRE(out.getVelocity() == 100);

    REQUIRE(q.tryPop(out));
    REQUIRE(out.isNoteOff());
}

TEST_CASE("SPSCQueue: one producer and one consumer thread lose nothing")
{
    SPSCQueue<int, 64> q;
    const int total = 20000;

    std::thread producer([&q] {
        for (int i = 0; i < total; ++i)
            while (!q.tryPush(i))
                std::this_thread::yield();
    });

    std::vector<int> received;
    received.reserve(total);
    while (static_cast<int>(received.size()) < total)
    {
        int v;
        if (q.tryPop(v))
            received.push_back(v);
        else
            std::this_thread::yield();
    }
    producer.join();

    bool inOrder = true;
    for (int i = 0; i < total; ++i)
        inOrder = inOrder && received[static_cast<size_t>(i)] == i;
    REQUIRE(inOrder);
    REQUIRE(q.empty());
}
