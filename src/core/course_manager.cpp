/**
 * @fileoverview course_manager.cpp
 * @brief Implementation of CourseManager.
 */

#include "minigolf/core/course_manager.hpp"
#include "minigolf/courses/bumper_course.hpp"
#include "minigolf/courses/simple_course.hpp"

void CourseManager::buildCourseList() {
  courseList.clear();
  for (auto c : SimulatorConstants::getAllCourses()) {
    courseList.emplace_back(c, SimulatorConstants::getCourseName(c));
  }
}

const std::vector<std::pair<SimulatorConstants::CourseType, std::string>>&
CourseManager::getCourseList() const {
  return courseList;
}

void CourseManager::setCurrentCourse(SimulatorConstants::CourseType course) {
  currentCourse = course;
}

SimulatorConstants::CourseType CourseManager::getCurrentCourse() const {
  return currentCourse;
}

std::unique_ptr<ICourse> CourseManager::createCourse(
    SimulatorConstants::CourseType courseType) const {
  switch (courseType) {
    case SimulatorConstants::CourseType::SIMPLE_COURSE:
      return std::make_unique<SimpleCourse>();

    case SimulatorConstants::CourseType::BUMPER_COURSE:
      return std::make_unique<BumperCourse>();

    default:
      return std::make_unique<SimpleCourse>();
  }
}
