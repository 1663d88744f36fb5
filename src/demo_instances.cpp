///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"


///////////////////////////
///     DEMO: BASIC     ///
///////////////////////////
static std::vector<RawCourse> basicPool() {
    std::vector<RawCourse> pool;
    pool.push_back({"CS101", "3", "Computer Science", "Lecture", "mon. 09:00-10:30"});
    pool.push_back({"CS102", "3", "Computer Science", "Lecture", "wed. 09:00-10:30"});
    pool.push_back({"CS103", "6", "Computer Science", "Lecture", "mon. 09:00-10:30"});
    return pool;
}

static DemoRequest makeDemoBasic() {
    DemoRequest req;
    req.title = "Basic pool, 6 credits";
    req.candidates = basicPool();
    req.constraints.targetCredits = 6;
    return req;
}

static DemoRequest makeDemoInfeasible() {
    DemoRequest req;
    req.title = "Basic pool, 5 credits (no exact subset)";
    req.candidates = basicPool();
    req.constraints.targetCredits = 5;
    return req;
}

static DemoRequest makeDemoField() {
    DemoRequest req;
    req.title = "Basic pool plus AI courses, AI preferred";
    req.candidates = basicPool();
    req.candidates.push_back({"CS104", "3", "AI", "Lecture", "tue. 09:00-10:30"});
    req.candidates.push_back({"CS105", "3", "AI", "Lecture", "thur. 09:00-10:30"});
    req.constraints.targetCredits = 6;
    req.constraints.fields = {"AI"};
    return req;
}

static DemoRequest makeDemoBusy() {
    DemoRequest req;
    req.title = "Basic pool, Monday morning blocked";
    req.candidates = basicPool();
    req.constraints.targetCredits = 6;
    req.constraints.busySchedule = "mon. 09:00-10:30";
    return req;
}


///////////////////////////
///   DEMO: CATALOGUE   ///
///////////////////////////
static DemoRequest makeDemoCatalogue() {
    DemoRequest req;
    req.title = "Semester catalogue, 18 credits, AI/Linguistics seminars, Tuesday and Friday afternoons blocked";

    std::vector<RawCourse>& c = req.candidates;
    c.push_back({"Dialog Systems", "6", "Artificial Intelligence", "Lecture", "tue. 09:45-11:15; thur. 09:45-11:15"});
    c.push_back({"Deep Learning", "6", "Artificial Intelligence", "Lecture", "mon. 14:00-15:30; wed. 14:00-15:30"});
    c.push_back({"Reinforcement Learning", "3", "Artificial Intelligence", "Seminar", "fri. 09:45-11:15"});
    c.push_back({"Knowledge Graphs", "3", "Artificial Intelligence", "Seminar", "wed. 11:30-13:00"});
    c.push_back({"Machine Translation", "6", "Computational Linguistics", "Lecture", "mon. 09:45-11:15; thur. 14:00-15:30"});
    c.push_back({"Corpus Linguistics", "3", "Computational Linguistics", "Seminar", "tue. 11:30-13:00"});
    c.push_back({"Syntax Theory", "3", "Computational Linguistics", "Seminar", "thur. 11:30-13:00"});
    c.push_back({"Speech Processing", "6", "Signal Processing", "Lecture", "tue. 14:00-15:30; fri. 14:00-15:30"});
    c.push_back({"Team Lab", "9", "Artificial Intelligence", "Project", "wed. 09:45-13:00; fri. 09:45-13:00"});
    c.push_back({"Statistics", "3", "Mathematics", "Lecture", "mon. 11:30-13:00"});
    c.push_back({"Linear Algebra", "3", "Mathematics", "Exercise", "wed. 08:00-09:30"});
    c.push_back({"Compiler Construction", "6", "Computer Science", "Lecture", "mon. 08:00-09:30; wed. 15:45-17:15"});
    c.push_back({"Database Systems", "3", "Computer Science", "Lecture", "thur. 08:00-09:30"});
    c.push_back({"Parallel Programming", "3", "Computer Science", "Exercise", "fri. 11:30-13:00"});
    c.push_back({"Ethics in AI", "3", "Philosophy", "Seminar", "thur. 15:45-17:15"});

    req.constraints.targetCredits = 18;
    req.constraints.fields = {"Artificial Intelligence", "Linguistics"};
    req.constraints.formats = {"Seminar"};
    req.constraints.busySchedule = "tue. 13:00-18:00; fri. 13:00-18:00";
    return req;
}


///////////////////////////
///      DISPATCH       ///
///////////////////////////
DemoRequest makeDemoRequest(DemoScenario scenario) {
    switch (scenario) {
        case DemoScenario::BASIC:      return makeDemoBasic();
        case DemoScenario::INFEASIBLE: return makeDemoInfeasible();
        case DemoScenario::FIELD:      return makeDemoField();
        case DemoScenario::BUSY:       return makeDemoBusy();
        case DemoScenario::CATALOGUE:  return makeDemoCatalogue();
    }
    return makeDemoBasic();
}

std::optional<DemoScenario> parseDemoScenario(const std::string& name) {
    if (name == "basic") return DemoScenario::BASIC;
    if (name == "infeasible") return DemoScenario::INFEASIBLE;
    if (name == "field") return DemoScenario::FIELD;
    if (name == "busy") return DemoScenario::BUSY;
    if (name == "catalogue") return DemoScenario::CATALOGUE;
    return std::nullopt;
}
