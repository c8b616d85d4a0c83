#define CATCH_CONFIG_RUNNER
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_session.hpp>

//Qt includes
#include <QCoreApplication>
#include <QThread>

int main( int argc, char* argv[] )
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setOrganizationName("LfsServe");
    QCoreApplication::setApplicationName("lfsserve-test");
    QCoreApplication::setApplicationVersion("1.0");

    app.thread()->setObjectName("Main QThread");

    //Network tests need a running event loop, so the session runs inside it
    int result = 0;
    QMetaObject::invokeMethod(&app, [&result, argc, argv]() {
        result = Catch::Session().run( argc, argv );
        QCoreApplication::quit();
    }, Qt::QueuedConnection);

    app.exec();

    return result;
}
