/**
 * @fileoverview course_manager.hpp
 * @brief Keeps the list of built-in courses and creates course objects.
 */

#ifndef MINIGOLF_COURSE_MANAGER_HPP
#define MINIGOLF_COURSE_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "minigolf/core/constants.hpp"
#include "minigolf/courses/i_course.hpp"

/**
 * @class CourseManager
 * @brief Catalog of available courses and a factory to create them.
 */
class CourseManager {
 public:
  /**
   * @brief Builds an internal list of all available courses.
   */
  void buildCourseList();

  /**
   * @brief Returns the list of courses built by buildCourseList().
   */
  const std::vector<std::pair<SimulatorConstants::CourseType, std::string>>&
  getCourseList() const;

  /**
   * @brief Sets the course that is considered current.
   */
  void setCurrentCourse(SimulatorConstants::CourseType course);

  /**
   * @brief Returns the currently selected course type.
   */
  SimulatorConstants::CourseType getCurrentCourse() const;

  /**
   * @brief Creates a new course object of the specified type.
   * @param courseType The chosen course type.
   * @return A unique_ptr to a newly constructed course.
   */
  std::unique_ptr<ICourse> createCourse(SimulatorConstants::CourseType courseType) const;

 private:
  std::vector<std::pair<SimulatorConstants::CourseType, std::string>> courseList;
  SimulatorConstants::CourseType currentCourse =
      SimulatorConstants::CourseType::SIMPLE_COURSE;
};

#endif  // MINIGOLF_COURSE_MANAGER_HPP
