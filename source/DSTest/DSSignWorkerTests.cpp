#include <DSSign/DSSignWorker.h>
#include <DSMesh/DSGTest.h>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

namespace DS
{

TEST( DSSign, WorkerSingleFlight )
{
    SignWorker worker;
    EXPECT_FALSE( worker.isOrdered() );
    EXPECT_FALSE( worker.processFinished() );

    std::promise<void> release;
    auto released = release.get_future().share();
    int result = 0;
    bool postProcessed = false;

    ASSERT_TRUE( worker.order( "first", [released, &result, &postProcessed] () -> std::function<void()>
    {
        released.wait();
        result = 42;
        return [&postProcessed] { postProcessed = true; };
    } ) );
    EXPECT_TRUE( worker.isOrdered() );
    EXPECT_EQ( worker.lastTaskName(), "first" );

    bool secondRan = false;
    EXPECT_FALSE( worker.order( "second", [&secondRan] () -> std::function<void()>
    {
        secondRan = true;
        return {};
    } ) );
    EXPECT_EQ( worker.lastTaskName(), "first" );
    EXPECT_FALSE( worker.processFinished() );

    release.set_value();
    worker.wait();
    EXPECT_EQ( result, 42 );
    EXPECT_TRUE( postProcessed );
    EXPECT_FALSE( secondRan );
    EXPECT_FALSE( worker.isOrdered() );
}

TEST( DSSign, WorkerReorderAfterFinish )
{
    SignWorker worker;
    int calls = 0;
    for ( int i = 0; i < 3; ++i )
    {
        ASSERT_TRUE( worker.order( "task", [&calls] () -> std::function<void()>
        {
            return [&calls] { ++calls; };
        } ) );
        while ( !worker.isFinished() )
            std::this_thread::yield();
        EXPECT_TRUE( worker.processFinished() );
        EXPECT_FALSE( worker.processFinished() );
    }
    EXPECT_EQ( calls, 3 );
}

TEST( DSSign, WorkerTaskThrows )
{
    SignWorker worker;
    ASSERT_TRUE( worker.order( "failing", [] () -> std::function<void()>
    {
        throw std::runtime_error( "broken" );
    } ) );
    worker.wait();
    EXPECT_FALSE( worker.isOrdered() );

    bool ran = false;
    ASSERT_TRUE( worker.order( "next", [&ran] () -> std::function<void()>
    {
        ran = true;
        return {};
    } ) );
    worker.wait();
    EXPECT_TRUE( ran );
}

TEST( DSSign, WorkerTaskThrowsNonStdException )
{
    SignWorker worker;
    std::string reported;
    ASSERT_TRUE( worker.order( "failing", [] () -> std::function<void()>
    {
        throw 42;
    }, [&reported] ( const std::string& msg ) { reported = msg; } ) );
    worker.wait();
    EXPECT_FALSE( worker.isOrdered() );
    EXPECT_EQ( reported, "Unknown error" );

    reported.clear();
    ASSERT_TRUE( worker.order( "failing again", [] () -> std::function<void()>
    {
        throw std::runtime_error( "broken" );
    }, [&reported] ( const std::string& msg ) { reported = msg; } ) );
    worker.wait();
    EXPECT_EQ( reported, "broken" );

    bool ran = false;
    ASSERT_TRUE( worker.order( "next", [&ran] () -> std::function<void()>
    {
        ran = true;
        return {};
    } ) );
    worker.wait();
    EXPECT_TRUE( ran );
}

} //namespace DS
