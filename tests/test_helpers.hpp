// test_helpers.hpp
//
// Small BPMN models and event builders shared by the unit tests.
#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "event_log.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace fixtures {

// start -> A -> B -> end, with the bpmn: prefix
inline const char* SEQUENCE_BPMN = R"(<?xml version="1.0" encoding="UTF-8"?>
<bpmn:definitions xmlns:bpmn="http://www.omg.org/spec/BPMN/20100524/MODEL" id="defs">
  <bpmn:process id="proc" isExecutable="true">
    <bpmn:startEvent id="s" />
    <bpmn:task id="t_a" name="A" />
    <bpmn:userTask id="t_b" name="B" />
    <bpmn:endEvent id="e" />
    <bpmn:sequenceFlow id="f0" sourceRef="s" targetRef="t_a" />
    <bpmn:sequenceFlow id="f1" sourceRef="t_a" targetRef="t_b" />
    <bpmn:sequenceFlow id="f2" sourceRef="t_b" targetRef="e" />
  </bpmn:process>
</bpmn:definitions>
)";

// start -> A -> XOR split -> (B | C) -> XOR join -> D -> end, no prefix
inline const char* EXCLUSIVE_BPMN = R"(<?xml version="1.0" encoding="UTF-8"?>
<definitions xmlns="http://www.omg.org/spec/BPMN/20100524/MODEL" id="defs">
  <process id="proc">
    <startEvent id="s" />
    <task id="t_a" name="A" />
    <exclusiveGateway id="g1" />
    <task id="t_b" name="B" />
    <serviceTask id="t_c" name="C" />
    <exclusiveGateway id="g2" />
    <task id="t_d" name="D" />
    <endEvent id="e" />
    <sequenceFlow id="f0" sourceRef="s" targetRef="t_a" />
    <sequenceFlow id="f1" sourceRef="t_a" targetRef="g1" />
    <sequenceFlow id="f2" sourceRef="g1" targetRef="t_b" />
    <sequenceFlow id="f3" sourceRef="g1" targetRef="t_c" />
    <sequenceFlow id="f4" sourceRef="t_b" targetRef="g2" />
    <sequenceFlow id="f5" sourceRef="t_c" targetRef="g2" />
    <sequenceFlow id="f6" sourceRef="g2" targetRef="t_d" />
    <sequenceFlow id="f7" sourceRef="t_d" targetRef="e" />
  </process>
</definitions>
)";

// start -> A -> AND split -> (B || C) -> AND join -> D -> end
inline const char* PARALLEL_BPMN = R"(<?xml version="1.0" encoding="UTF-8"?>
<bpmn:definitions xmlns:bpmn="http://www.omg.org/spec/BPMN/20100524/MODEL" id="defs">
  <bpmn:process id="proc">
    <bpmn:startEvent id="s" />
    <bpmn:task id="t_a" name="A" />
    <bpmn:parallelGateway id="p1" />
    <bpmn:task id="t_b" name="B" />
    <bpmn:task id="t_c" name="C" />
    <bpmn:parallelGateway id="p2" />
    <bpmn:task id="t_d" name="D" />
    <bpmn:endEvent id="e" />
    <bpmn:sequenceFlow id="f0" sourceRef="s" targetRef="t_a" />
    <bpmn:sequenceFlow id="f1" sourceRef="t_a" targetRef="p1" />
    <bpmn:sequenceFlow id="f2" sourceRef="p1" targetRef="t_b" />
    <bpmn:sequenceFlow id="f3" sourceRef="p1" targetRef="t_c" />
    <bpmn:sequenceFlow id="f4" sourceRef="t_b" targetRef="p2" />
    <bpmn:sequenceFlow id="f5" sourceRef="t_c" targetRef="p2" />
    <bpmn:sequenceFlow id="f6" sourceRef="p2" targetRef="t_d" />
    <bpmn:sequenceFlow id="f7" sourceRef="t_d" targetRef="e" />
  </bpmn:process>
</bpmn:definitions>
)";

// start -> AND split -> (B || C) -> AND join -> end
inline const char* PARALLEL_START_BPMN = R"(<?xml version="1.0" encoding="UTF-8"?>
<bpmn:definitions xmlns:bpmn="http://www.omg.org/spec/BPMN/20100524/MODEL" id="defs">
  <bpmn:process id="proc">
    <bpmn:startEvent id="s" />
    <bpmn:parallelGateway id="p1" />
    <bpmn:task id="t_b" name="B" />
    <bpmn:task id="t_c" name="C" />
    <bpmn:parallelGateway id="p2" />
    <bpmn:endEvent id="e" />
    <bpmn:sequenceFlow id="f0" sourceRef="s" targetRef="p1" />
    <bpmn:sequenceFlow id="f1" sourceRef="p1" targetRef="t_b" />
    <bpmn:sequenceFlow id="f2" sourceRef="p1" targetRef="t_c" />
    <bpmn:sequenceFlow id="f3" sourceRef="t_b" targetRef="p2" />
    <bpmn:sequenceFlow id="f4" sourceRef="t_c" targetRef="p2" />
    <bpmn:sequenceFlow id="f5" sourceRef="p2" targetRef="e" />
  </bpmn:process>
</bpmn:definitions>
)";

// start -> XOR split -> (B | C) -> end
inline const char* GATEWAY_START_BPMN = R"(<?xml version="1.0" encoding="UTF-8"?>
<bpmn:definitions xmlns:bpmn="http://www.omg.org/spec/BPMN/20100524/MODEL" id="defs">
  <bpmn:process id="proc">
    <bpmn:startEvent id="s" />
    <bpmn:exclusiveGateway id="g1" />
    <bpmn:task id="t_b" name="B" />
    <bpmn:task id="t_c" name="C" />
    <bpmn:endEvent id="e" />
    <bpmn:sequenceFlow id="f0" sourceRef="s" targetRef="g1" />
    <bpmn:sequenceFlow id="f1" sourceRef="g1" targetRef="t_b" />
    <bpmn:sequenceFlow id="f2" sourceRef="g1" targetRef="t_c" />
    <bpmn:sequenceFlow id="f3" sourceRef="t_b" targetRef="e" />
    <bpmn:sequenceFlow id="f4" sourceRef="t_c" targetRef="e" />
  </bpmn:process>
</bpmn:definitions>
)";

// start -> A -> OR split -> (B, C) -> OR join -> D -> end
inline const char* INCLUSIVE_BPMN = R"(<?xml version="1.0" encoding="UTF-8"?>
<bpmn:definitions xmlns:bpmn="http://www.omg.org/spec/BPMN/20100524/MODEL" id="defs">
  <bpmn:process id="proc">
    <bpmn:startEvent id="s" />
    <bpmn:task id="t_a" name="A" />
    <bpmn:inclusiveGateway id="o1" />
    <bpmn:task id="t_b" name="B" />
    <bpmn:task id="t_c" name="C" />
    <bpmn:inclusiveGateway id="o2" />
    <bpmn:task id="t_d" name="D" />
    <bpmn:endEvent id="e" />
    <bpmn:sequenceFlow id="f0" sourceRef="s" targetRef="t_a" />
    <bpmn:sequenceFlow id="f1" sourceRef="t_a" targetRef="o1" />
    <bpmn:sequenceFlow id="f2" sourceRef="o1" targetRef="t_b" />
    <bpmn:sequenceFlow id="f3" sourceRef="o1" targetRef="t_c" />
    <bpmn:sequenceFlow id="f4" sourceRef="t_b" targetRef="o2" />
    <bpmn:sequenceFlow id="f5" sourceRef="t_c" targetRef="o2" />
    <bpmn:sequenceFlow id="f6" sourceRef="o2" targetRef="t_d" />
    <bpmn:sequenceFlow id="f7" sourceRef="t_d" targetRef="e" />
  </bpmn:process>
</bpmn:definitions>
)";

// Seconds after the epoch.
inline Timestamp at(int seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

inline Event finished(const std::string& case_id, const std::string& activity, int start, int end,
                      const std::string& resource = "r1") {
    Event e;
    e.case_id = case_id;
    e.activity = activity;
    e.resource = resource;
    e.start_time = at(start);
    e.end_time = at(end);
    return e;
}

inline Event ongoing(const std::string& case_id, const std::string& activity, int start,
                     std::optional<int> enabled = std::nullopt, const std::string& resource = "r1") {
    Event e;
    e.case_id = case_id;
    e.activity = activity;
    e.resource = resource;
    e.start_time = at(start);
    if (enabled) e.enabled_time = at(*enabled);
    return e;
}

}  // namespace fixtures

#endif
