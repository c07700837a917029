#define BOOST_TEST_MODULE ReaderTest

#include <boost/test/unit_test.hpp>

#include <iostream>
#include <sstream>
#include <string>

#include "mplsq/errors.h"
#include "mplsq/network.h"
#include "mplsq/utils.h"
#include "networks.h"

using namespace mplsq;

// sends log messages at or above threshold to a string for one scope
class CapturedLog
{
    public:
        CapturedLog(std::ostringstream& out, int threshold)
            : saved_threshold(log_threshold), saved_buf(std::cout.rdbuf(out.rdbuf()))
        {
            log_threshold = threshold;
        }

        ~CapturedLog()
        {
            std::cout.rdbuf(saved_buf);
            log_threshold = saved_threshold;
        }

    private:
        int saved_threshold;
        std::streambuf* saved_buf;
};

BOOST_AUTO_TEST_CASE(ReadChain) {
    Network network = chain().build();

    BOOST_CHECK_EQUAL(network.routers.size(), 3);
    BOOST_CHECK_EQUAL(network.interfaces.size(), 4);
    BOOST_CHECK_EQUAL(network.links.size(), 2);
    BOOST_CHECK_EQUAL(network.rules.size(), 2);

    int s2 = network.find_router("S2");
    BOOST_REQUIRE(s2 != NONE);
    int in = network.find_interface(s2, "a");
    BOOST_REQUIRE(in != NONE);

    const Rule* rule = network.find_rule(in, "11");
    BOOST_REQUIRE(rule != 0);
    BOOST_CHECK_EQUAL(rule->routes.size(), 1);
    BOOST_CHECK_EQUAL(network.interface_name(rule->routes[0].out), "S2.b");
    BOOST_REQUIRE_EQUAL(rule->routes[0].actions.size(), 1);
    BOOST_CHECK_EQUAL(rule->routes[0].actions[0].type, SWAP);
    BOOST_CHECK_EQUAL(rule->routes[0].actions[0].label, "12");

    BOOST_CHECK(network.find_rule(in, "10") == 0);
    BOOST_CHECK_EQUAL(network.link_name(0), "S1.a--S2.a");
    BOOST_CHECK_EQUAL(network.partner(network.find_interface("S1.a")), in);
}

BOOST_AUTO_TEST_CASE(FindLinkByName) {
    Network network = detour().build();

    BOOST_CHECK_EQUAL(network.find_link("S2.b--S3.a"), 1);
    BOOST_CHECK_EQUAL(network.find_link("S3.a--S2.b"), 1);
    BOOST_CHECK_EQUAL(network.find_link("S1--S4"), 2);
    BOOST_CHECK_EQUAL(network.find_link("S1--S3"), NONE);
    BOOST_CHECK_EQUAL(network.find_link("S1.a--S4.a"), NONE);
    BOOST_CHECK_EQUAL(network.find_link("nonsense"), NONE);
}

BOOST_AUTO_TEST_CASE(BackupRoutesKeepOrder) {
    Network network = detour().build();
    const Rule* rule = network.find_rule(network.find_interface("S1.a"), "10");
    BOOST_REQUIRE(rule != 0);
    BOOST_REQUIRE_EQUAL(rule->routes.size(), 2);
    BOOST_CHECK_EQUAL(network.interface_name(rule->routes[0].out), "S1.a");
    BOOST_CHECK_EQUAL(network.interface_name(rule->routes[1].out), "S1.c");
}

BOOST_AUTO_TEST_CASE(DottedRouterNames) {
    XmlNetwork xml;
    xml.router("R.1", {"x"});
    xml.router("R", {"1.x"});
    xml.link("R.1", "x", "R", "1.x");
    Network network = xml.build();

    // "R.1.x" splits either way; one of the two readings must be found
    int iface = network.find_interface("R.1.x");
    int first = network.find_interface(network.find_router("R.1"), "x");
    int second = network.find_interface(network.find_router("R"), "1.x");
    BOOST_REQUIRE(iface != NONE);
    BOOST_CHECK(iface == first || iface == second);
    BOOST_CHECK_EQUAL(network.find_link("R.1--R"), 0);
}

BOOST_AUTO_TEST_CASE(UnwellFormedXml) {
    XmlNetwork xml = chain();
    BOOST_CHECK_THROW(XmlNetwork::load("<network><routers>", xml.routing()), MalformedInputError);
    BOOST_CHECK_THROW(XmlNetwork::load(xml.topology(), "<routes><routings>"), MalformedInputError);
}

BOOST_AUTO_TEST_CASE(MissingNetworkElement) {
    BOOST_CHECK_THROW(XmlNetwork::load("<topology/>", "<routes><routings/></routes>"), MalformedInputError);
}

BOOST_AUTO_TEST_CASE(DanglingInterface) {
    XmlNetwork xml;
    xml.router("A", {"x", "y"});
    xml.router("B", {"x"});
    xml.link("A", "x", "B", "x");
    try {
        xml.build();
        BOOST_FAIL("expected DanglingInterfaceError");
    } catch (const DanglingInterfaceError& e) {
        BOOST_CHECK_EQUAL(e.document, "topology");
        BOOST_CHECK(std::string(e.what()).find("A.y") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(LinkToUnknownRouter) {
    XmlNetwork xml;
    xml.router("A", {"x"});
    xml.link("A", "x", "B", "x");
    BOOST_CHECK_THROW(xml.build(), UnknownReferenceError);
}

BOOST_AUTO_TEST_CASE(SelfLink) {
    XmlNetwork xml;
    xml.router("A", {"x", "y"});
    xml.link("A", "x", "A", "y");
    BOOST_CHECK_THROW(xml.build(), MalformedInputError);
}

BOOST_AUTO_TEST_CASE(InterfaceLinkedTwice) {
    XmlNetwork xml;
    xml.router("A", {"x"});
    xml.router("B", {"x", "y"});
    xml.link("A", "x", "B", "x");
    xml.link("A", "x", "B", "y");
    BOOST_CHECK_THROW(xml.build(), MalformedInputError);
}

BOOST_AUTO_TEST_CASE(DuplicateRouter) {
    XmlNetwork xml;
    xml.router("A", {});
    xml.router("A", {});
    BOOST_CHECK_THROW(xml.build(), MalformedInputError);
}

BOOST_AUTO_TEST_CASE(RoutingForUnknownRouter) {
    XmlNetwork xml = chain();
    xml.rule("S9", "a", "10", {route("a", {})});
    try {
        xml.build();
        BOOST_FAIL("expected UnknownReferenceError");
    } catch (const UnknownReferenceError& e) {
        BOOST_CHECK_EQUAL(e.document, "routing");
    }
}

BOOST_AUTO_TEST_CASE(RouteToUnknownInterface) {
    XmlNetwork xml = chain();
    xml.rule("S3", "a", "12", {route("z", {"pop"})});
    BOOST_CHECK_THROW(xml.build(), UnknownReferenceError);
}

BOOST_AUTO_TEST_CASE(UnknownActionType) {
    XmlNetwork xml = chain();
    xml.rule("S3", "a", "12", {route("a", {"rotate:1"})});
    BOOST_CHECK_THROW(xml.build(), MalformedInputError);
}

BOOST_AUTO_TEST_CASE(PushWithoutLabel) {
    XmlNetwork xml = chain();
    xml.rule("S3", "a", "12", {route("a", {"push"})});
    BOOST_CHECK_THROW(xml.build(), MalformedInputError);
}

BOOST_AUTO_TEST_CASE(DuplicateRule) {
    XmlNetwork xml = chain();
    xml.rule("S2", "a", "11", {route("a", {})});
    BOOST_CHECK_THROW(xml.build(), MalformedInputError);
}

BOOST_AUTO_TEST_CASE(ExtraTeGroupRoutesWarned) {
    XmlNetwork xml;
    xml.router("A", {"x", "y"});
    xml.router("B", {"x", "y"});
    xml.link("A", "x", "B", "x");
    xml.link("A", "y", "B", "y");
    std::string routing =
        "<routes><routings><routing for=\"A\"><destinations>"
        "<destination from=\"x\" label=\"10\"><te-groups><te-group><routes>"
        "<route to=\"x\"><actions><action type=\"swap\" arg=\"11\"/></actions></route>"
        "<route to=\"y\"><actions><action type=\"swap\" arg=\"12\"/></actions></route>"
        "</routes></te-group></te-groups></destination>"
        "</destinations></routing></routings></routes>";

    std::ostringstream captured;
    Network network;
    {
        CapturedLog guard(captured, 5);
        network = XmlNetwork::load(xml.topology(), routing);
    }

    BOOST_CHECK(captured.str().find("warning:") != std::string::npos);
    BOOST_CHECK(captured.str().find("dropping 1") != std::string::npos);

    const Rule* rule = network.find_rule(network.find_interface("A.x"), "10");
    BOOST_REQUIRE(rule != 0);
    BOOST_REQUIRE_EQUAL(rule->routes.size(), 1);
    BOOST_CHECK_EQUAL(network.interface_name(rule->routes[0].out), "A.x");
}
